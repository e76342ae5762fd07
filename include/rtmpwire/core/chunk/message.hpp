#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "rtmpwire/core/protocol/message_type.hpp"


namespace rtmpwire::core::chunk {

// -----------------------------------------------------------------------------
// Message - one complete protocol message
//
// Inbound messages are built chunk by chunk: buffer grows until it holds
// length bytes. Outbound messages must be complete (buffer.size() == length)
// when handed to the send path.
// -----------------------------------------------------------------------------
struct Message {
    protocol::MessageType type{protocol::MessageType::None};
    std::uint32_t chunk_stream_id{0};
    std::uint32_t stream_id{0};
    std::uint32_t timestamp{0};           // header timestamp field of the first chunk
    std::uint32_t absolute_timestamp{0};  // resolved absolute timestamp
    std::uint32_t length{0};
    std::vector<std::uint8_t> buffer;

    [[nodiscard]]
    inline std::uint32_t remaining_bytes() const noexcept {
        return length - static_cast<std::uint32_t>(buffer.size());
    }

    [[nodiscard]]
    inline bool is_complete() const noexcept {
        return buffer.size() == length;
    }

    [[nodiscard]]
    inline std::string_view payload() const noexcept {
        return {reinterpret_cast<const char*>(buffer.data()), buffer.size()};
    }
};

// Builds a complete outbound message from a payload
[[nodiscard]]
inline Message make_message(std::uint32_t chunk_stream_id,
                            protocol::MessageType type,
                            std::uint32_t stream_id,
                            std::uint32_t timestamp,
                            std::vector<std::uint8_t> payload)
{
    Message msg;
    msg.type = type;
    msg.chunk_stream_id = chunk_stream_id;
    msg.stream_id = stream_id;
    msg.timestamp = timestamp;
    msg.absolute_timestamp = timestamp;
    msg.length = static_cast<std::uint32_t>(payload.size());
    msg.buffer = std::move(payload);
    return msg;
}

} // namespace rtmpwire::core::chunk
