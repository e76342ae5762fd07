#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "rtmpwire/core/chunk/chunk_stream.hpp"
#include "rtmpwire/core/chunk/header.hpp"
#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/protocol/chunk_stream_id.hpp"
#include "rtmpwire/core/config/protocol.hpp"
#include "rtmpwire/core/transport/stream_concept.hpp"
#include "rtmpwire/core/transport/io.hpp"
#include "rtmpwire/core/transport/error.hpp"
#include "lcr/log/logger.hpp"


namespace rtmpwire::core::chunk {

// -----------------------------------------------------------------------------
// chunk::Fragmenter - send-path half of the chunk codec
//
// Splits a message into chunks of at most chunk_size payload bytes: one Full
// header for the first chunk, Continuation headers for the rest. A message
// with an empty payload goes out as a lone Full header.
//
// Validation happens before the first byte is written, so InvalidMessage,
// MessageTooLarge and InvalidChunkStreamId leave the stream untouched.
// Only TransportFailure means a partial message may be on the wire.
//
// Not thread-safe. Owned and driven by a single send loop.
// -----------------------------------------------------------------------------
class Fragmenter {
public:
    Fragmenter() = default;

    Fragmenter(const Fragmenter&) = delete;
    Fragmenter& operator=(const Fragmenter&) = delete;

    template<transport::ByteWriter W>
    [[nodiscard]]
    inline transport::Error write_message(W& out, const Message& msg, std::uint32_t chunk_size,
                                          std::uint32_t* chunks_written = nullptr) noexcept
    {
        using transport::Error;
        if (chunks_written) {
            *chunks_written = 0;
        }
        // Preconditions
        if (chunk_size == 0) [[unlikely]] {
            return Error::InvalidState;
        }
        if (!protocol::chunk_stream::is_valid(msg.chunk_stream_id)) [[unlikely]] {
            return Error::InvalidChunkStreamId;
        }
        if (msg.length > config::MAX_MESSAGE_LENGTH) [[unlikely]] {
            return Error::MessageTooLarge;
        }
        if (msg.buffer.size() != msg.length) [[unlikely]] {
            return Error::InvalidMessage;
        }

        auto& cs = stream_(msg.chunk_stream_id);
        Header first;
        first.format = HeaderFormat::Full;
        first.chunk_stream_id = msg.chunk_stream_id;
        first.timestamp = msg.timestamp;
        first.message_length = msg.length;
        first.message_type = msg.type;
        first.message_stream_id = msg.stream_id;

        Header next;
        next.format = HeaderFormat::Continuation;
        next.chunk_stream_id = msg.chunk_stream_id;

        const char* data = reinterpret_cast<const char*>(msg.buffer.data());
        std::uint32_t remaining = msg.length;
        std::uint32_t chunks = 0;
        do {
            auto err = write_header(out, (chunks == 0) ? first : next);
            if (err == Error::None) {
                const std::uint32_t n = std::min(remaining, chunk_size);
                err = transport::write_all(out, data, n);
                data += n;
                remaining -= n;
            }
            if (err != Error::None) [[unlikely]] {
                RW_ERROR("[TX] Write failed on chunk stream " << msg.chunk_stream_id << " after " << chunks << " chunks");
                return err;
            }
            ++chunks;
            if (chunks_written) {
                *chunks_written = chunks;
            }
        } while (remaining > 0);

        cs.last_header = first;
        ++cs.messages_sent;
        RW_TRACE("[TX] " << to_string(msg.type) << " csid=" << msg.chunk_stream_id << " len=" << msg.length
                 << " in " << chunks << " chunks of <= " << chunk_size);
        return Error::None;
    }

    [[nodiscard]]
    inline const OutboundChunkStream* find(std::uint32_t chunk_stream_id) const noexcept {
        auto it = streams_.find(chunk_stream_id);
        return (it == streams_.end()) ? nullptr : &it->second;
    }

private:
    inline OutboundChunkStream& stream_(std::uint32_t chunk_stream_id) {
        auto [it, inserted] = streams_.try_emplace(chunk_stream_id);
        if (inserted) {
            it->second.id = chunk_stream_id;
        }
        return it->second;
    }

private:
    std::unordered_map<std::uint32_t, OutboundChunkStream> streams_;
};

} // namespace rtmpwire::core::chunk
