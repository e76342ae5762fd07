#pragma once

#include <cstdint>
#include <optional>

#include "rtmpwire/core/chunk/header.hpp"
#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/config/protocol.hpp"
#include "rtmpwire/core/transport/error.hpp"


namespace rtmpwire::core::chunk {

/*
===============================================================================
 Chunk stream state
===============================================================================

Per-chunk-stream-id context, one table per direction. Entries are created on
first use and live for the whole connection.

Inbound header resolution (resolve()):

  Full                 header replaces last_header;
                       absolute = timestamp
  SameStream           message stream id inherited;
                       absolute = last absolute + delta
  SameLengthAndStream  stream id, length and type inherited;
                       absolute = last absolute + delta
  Continuation         everything inherited, last_header untouched;
                       continuing a message:  absolute unchanged
                       starting a message:    absolute = last absolute + last delta

A compressed header on a chunk stream that never saw a header is a framing
fault (MissingPreviousHeader).

Absolute timestamps accumulate in 64 bits and wrap modulo TIMESTAMP_MAX + 1.
===============================================================================
*/

[[nodiscard]]
inline constexpr std::uint32_t add_timestamp(std::uint32_t base, std::uint32_t delta) noexcept {
    constexpr std::uint64_t period = std::uint64_t(config::TIMESTAMP_MAX) + 1;
    const std::uint64_t sum = std::uint64_t(base) + delta;
    return static_cast<std::uint32_t>(sum > config::TIMESTAMP_MAX ? sum % period : sum);
}

[[nodiscard]]
inline constexpr std::uint32_t wrap_timestamp(std::uint32_t ts) noexcept {
    return add_timestamp(ts, 0);
}


// ---------------------------------------------------------------------
// Inbound (receive loop only)
// ---------------------------------------------------------------------
struct InboundChunkStream {
    std::uint32_t id{0};
    std::optional<Header> last_header;
    std::uint32_t last_absolute_timestamp{0};
    std::optional<Message> in_progress;
};

// Fills the fields h inherits from cs and computes its absolute timestamp.
// Updates cs (last header, last absolute timestamp) on success.
[[nodiscard]]
inline transport::Error resolve(InboundChunkStream& cs, Header& h, std::uint32_t& absolute) noexcept {
    if (h.format != HeaderFormat::Full && !cs.last_header) [[unlikely]] {
        return transport::Error::MissingPreviousHeader;
    }
    switch (h.format) {
        case HeaderFormat::Full:
            absolute = wrap_timestamp(h.timestamp);
            cs.last_header = h;
            break;

        case HeaderFormat::SameStream:
            h.message_stream_id = cs.last_header->message_stream_id;
            absolute = add_timestamp(cs.last_absolute_timestamp, h.timestamp);
            cs.last_header = h;
            break;

        case HeaderFormat::SameLengthAndStream:
            h.message_stream_id = cs.last_header->message_stream_id;
            h.message_length = cs.last_header->message_length;
            h.message_type = cs.last_header->message_type;
            absolute = add_timestamp(cs.last_absolute_timestamp, h.timestamp);
            cs.last_header = h;
            break;

        case HeaderFormat::Continuation:
            h.message_stream_id = cs.last_header->message_stream_id;
            h.message_length = cs.last_header->message_length;
            h.message_type = cs.last_header->message_type;
            h.timestamp = cs.last_header->timestamp;
            absolute = cs.in_progress
                ? cs.last_absolute_timestamp
                : add_timestamp(cs.last_absolute_timestamp, cs.last_header->timestamp);
            break;
    }
    cs.last_absolute_timestamp = absolute;
    return transport::Error::None;
}


// ---------------------------------------------------------------------
// Outbound (send loop only)
// ---------------------------------------------------------------------
struct OutboundChunkStream {
    std::uint32_t id{0};
    std::optional<Header> last_header;
    std::uint64_t messages_sent{0};
};

} // namespace rtmpwire::core::chunk
