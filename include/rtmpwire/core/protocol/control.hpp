#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/protocol/message_type.hpp"
#include "rtmpwire/core/protocol/chunk_stream_id.hpp"
#include "rtmpwire/core/protocol/parameters.hpp"
#include "rtmpwire/core/config/protocol.hpp"
#include "lcr/endian.hpp"


namespace rtmpwire::core::protocol {

/*
===============================================================================
 Protocol control messages (chunk stream 2, message stream 0)
===============================================================================

  type        payload
  ----------  ----------------------------------------------------------
  ChunkSize   4 bytes BE, top bit reserved
  Abort       4 bytes BE chunk stream id
  Ack         4 bytes BE sequence number (bytes received so far)
  Ping        2 bytes BE event type + event data (4 bytes BE for pings)
  AckSize     4 bytes BE window size
  Bandwidth   4 bytes BE window size + 1 byte limit type

Builders produce complete outbound messages; parsers validate payload length
and return false on a malformed payload.
===============================================================================
*/

// User control event types (payload of MessageType::Ping)
enum class UserControlEvent : uint16_t {
    StreamBegin      = 0,
    StreamEof        = 1,
    StreamDry        = 2,
    SetBufferLength  = 3,
    StreamIsRecorded = 4,
    PingRequest      = 6,
    PingResponse     = 7
};

[[nodiscard]]
inline constexpr std::string_view to_string(UserControlEvent e) noexcept {
    switch (e) {
        case UserControlEvent::StreamBegin:      return "StreamBegin";
        case UserControlEvent::StreamEof:        return "StreamEof";
        case UserControlEvent::StreamDry:        return "StreamDry";
        case UserControlEvent::SetBufferLength:  return "SetBufferLength";
        case UserControlEvent::StreamIsRecorded: return "StreamIsRecorded";
        case UserControlEvent::PingRequest:      return "PingRequest";
        case UserControlEvent::PingResponse:     return "PingResponse";
        default:                                 return "Unknown";
    }
}


// -----------------------------------------------------------------------------
// Builders
// -----------------------------------------------------------------------------

namespace detail {

[[nodiscard]]
inline chunk::Message control_message(MessageType type, std::vector<std::uint8_t> payload) {
    return chunk::make_message(chunk_stream::Protocol, type, 0, 0, std::move(payload));
}

[[nodiscard]]
inline std::vector<std::uint8_t> u32_payload(std::uint32_t value) {
    std::vector<std::uint8_t> p(4);
    lcr::store_be32(p.data(), value);
    return p;
}

} // namespace detail

[[nodiscard]]
inline chunk::Message make_set_chunk_size(std::uint32_t size) {
    return detail::control_message(MessageType::ChunkSize, detail::u32_payload(size & 0x7FFFFFFF));
}

[[nodiscard]]
inline chunk::Message make_abort(std::uint32_t chunk_stream_id) {
    return detail::control_message(MessageType::Abort, detail::u32_payload(chunk_stream_id));
}

[[nodiscard]]
inline chunk::Message make_acknowledgement(std::uint32_t sequence_number) {
    return detail::control_message(MessageType::Ack, detail::u32_payload(sequence_number));
}

[[nodiscard]]
inline chunk::Message make_window_ack_size(std::uint32_t window) {
    return detail::control_message(MessageType::AckSize, detail::u32_payload(window));
}

[[nodiscard]]
inline chunk::Message make_set_peer_bandwidth(std::uint32_t window, BandwidthLimit limit) {
    auto p = detail::u32_payload(window);
    p.push_back(static_cast<std::uint8_t>(limit));
    return detail::control_message(MessageType::Bandwidth, std::move(p));
}

[[nodiscard]]
inline chunk::Message make_user_control(UserControlEvent event, std::uint32_t value) {
    std::vector<std::uint8_t> p(6);
    lcr::store_be16(p.data(), static_cast<std::uint16_t>(event));
    lcr::store_be32(p.data() + 2, value);
    return detail::control_message(MessageType::Ping, std::move(p));
}


// -----------------------------------------------------------------------------
// Parsers
// -----------------------------------------------------------------------------

// Reads the leading 4-byte big-endian value of a control payload
[[nodiscard]]
inline bool parse_u32(const chunk::Message& msg, std::uint32_t& out) noexcept {
    if (msg.buffer.size() < 4) {
        return false;
    }
    out = lcr::load_be32(msg.buffer.data());
    return true;
}

// Chunk size: low 31 bits, zero is rejected
[[nodiscard]]
inline bool parse_chunk_size(const chunk::Message& msg, std::uint32_t& out) noexcept {
    std::uint32_t raw = 0;
    if (!parse_u32(msg, raw)) {
        return false;
    }
    raw &= 0x7FFFFFFF;
    if (raw == 0) {
        return false;
    }
    out = (raw > config::MAX_CHUNK_SIZE) ? config::MAX_CHUNK_SIZE : raw;
    return true;
}

[[nodiscard]]
inline bool parse_peer_bandwidth(const chunk::Message& msg, std::uint32_t& window, BandwidthLimit& limit) noexcept {
    if (msg.buffer.size() < 5 || !parse_u32(msg, window)) {
        return false;
    }
    limit = static_cast<BandwidthLimit>(msg.buffer[4]);
    return true;
}

// Event data is optional for some events (value stays 0)
[[nodiscard]]
inline bool parse_user_control(const chunk::Message& msg, UserControlEvent& event, std::uint32_t& value) noexcept {
    if (msg.buffer.size() < 2) {
        return false;
    }
    event = static_cast<UserControlEvent>(lcr::load_be16(msg.buffer.data()));
    value = (msg.buffer.size() >= 6) ? lcr::load_be32(msg.buffer.data() + 2) : 0;
    return true;
}

} // namespace rtmpwire::core::protocol
