#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "rtmpwire/core/chunk/chunk_stream.hpp"
#include "rtmpwire/core/chunk/header.hpp"
#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/transport/stream_concept.hpp"
#include "rtmpwire/core/transport/io.hpp"
#include "rtmpwire/core/transport/error.hpp"
#include "lcr/log/logger.hpp"


namespace rtmpwire::core::chunk {

/*
===============================================================================
 chunk::Reassembler
===============================================================================

Receive-path half of the chunk codec. Owns the inbound chunk stream table and
turns the interleaved chunk sequence back into whole messages.

Each read_chunk() call consumes exactly one chunk: a header, then
min(remaining, chunk_size) payload bytes appended to the message in progress
on that chunk stream. When the last byte of a message arrives, the message is
moved out and the chunk stream becomes idle again.

The chunk size is passed per call: a renegotiation applies to the next chunk
read, whatever message it belongs to.

Not thread-safe. Owned and driven by a single receive loop.
===============================================================================
*/

class Reassembler {
public:
    Reassembler() = default;

    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    // Reads one chunk. completed is engaged only when this chunk finished a message.
    template<transport::ByteReader R>
    [[nodiscard]]
    inline transport::Error read_chunk(R& in, std::uint32_t chunk_size, std::optional<Message>& completed) noexcept {
        using transport::Error;
        completed.reset();
        if (chunk_size == 0) [[unlikely]] {
            return Error::InvalidState;
        }
        // 1) Header
        Header h;
        auto err = read_header(in, h);
        if (err != Error::None) {
            return err;
        }
        // 2) Chunk stream context + header inheritance
        auto& cs = stream_(h.chunk_stream_id);
        std::uint32_t absolute = 0;
        err = resolve(cs, h, absolute);
        if (err != Error::None) {
            RW_ERROR("[CHUNK] " << to_string(h.format) << " header on chunk stream " << h.chunk_stream_id
                     << " without a previous header");
            return err;
        }
        // 3) Message in progress
        if (cs.in_progress && h.format != HeaderFormat::Continuation) [[unlikely]] {
            RW_WARN("[CHUNK] New message header on chunk stream " << h.chunk_stream_id << " discards a partial message ("
                    << cs.in_progress->buffer.size() << "/" << cs.in_progress->length << " bytes)");
            cs.in_progress.reset();
            ++discarded_;
        }
        if (!cs.in_progress) {
            Message& msg = cs.in_progress.emplace();
            msg.type = h.message_type;
            msg.chunk_stream_id = h.chunk_stream_id;
            msg.stream_id = h.message_stream_id;
            msg.timestamp = h.timestamp;
            msg.absolute_timestamp = absolute;
            msg.length = h.message_length;
            msg.buffer.reserve(h.message_length);
        }
        // 4) Payload slice
        Message& msg = *cs.in_progress;
        const std::uint32_t n = std::min(msg.remaining_bytes(), chunk_size);
        if (n > 0) {
            const std::size_t offset = msg.buffer.size();
            msg.buffer.resize(offset + n);
            err = transport::read_exact(in, msg.buffer.data() + offset, n);
            if (err != Error::None) {
                return (err == Error::RemoteClosed) ? Error::ShortRead : err;
            }
        }
        RW_TRACE("[CHUNK] csid=" << h.chunk_stream_id << " +" << n << " bytes (" << msg.buffer.size() << "/" << msg.length << ")");
        // 5) Completion
        if (msg.is_complete()) {
            completed.emplace(std::move(msg));
            cs.in_progress.reset();
        }
        return Error::None;
    }

    // Drops the partial message on a chunk stream. Returns true if one was dropped.
    inline bool abort(std::uint32_t chunk_stream_id) noexcept {
        auto it = streams_.find(chunk_stream_id);
        if (it == streams_.end() || !it->second.in_progress) {
            return false;
        }
        it->second.in_progress.reset();
        ++discarded_;
        return true;
    }

    [[nodiscard]]
    inline const InboundChunkStream* find(std::uint32_t chunk_stream_id) const noexcept {
        auto it = streams_.find(chunk_stream_id);
        return (it == streams_.end()) ? nullptr : &it->second;
    }

    [[nodiscard]]
    inline std::size_t stream_count() const noexcept {
        return streams_.size();
    }

    // Partial messages dropped by abort() or by a competing message header
    [[nodiscard]]
    inline std::uint64_t discarded_messages() const noexcept {
        return discarded_;
    }

private:
    inline InboundChunkStream& stream_(std::uint32_t chunk_stream_id) {
        auto [it, inserted] = streams_.try_emplace(chunk_stream_id);
        if (inserted) {
            it->second.id = chunk_stream_id;
            RW_DEBUG("[CHUNK] New inbound chunk stream " << chunk_stream_id);
        }
        return it->second;
    }

private:
    std::unordered_map<std::uint32_t, InboundChunkStream> streams_;
    std::uint64_t discarded_{0};
};

} // namespace rtmpwire::core::chunk
