#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>


namespace rtmpwire::core::chunk {

// ===============================================================
// HEADER FORMAT (top two bits of the basic header)
// ===============================================================
enum class HeaderFormat : uint8_t {
    Full                = 0, // 11 bytes: timestamp, length, type, stream id
    SameStream          = 1, //  7 bytes: timestamp delta, length, type
    SameLengthAndStream = 2, //  3 bytes: timestamp delta
    Continuation        = 3  //  0 bytes
};

[[nodiscard]]
inline constexpr std::string_view to_string(HeaderFormat f) noexcept {
    switch (f) {
        case HeaderFormat::Full:                return "Full";
        case HeaderFormat::SameStream:          return "SameStream";
        case HeaderFormat::SameLengthAndStream: return "SameLengthAndStream";
        case HeaderFormat::Continuation:        return "Continuation";
        default:                                return "Unknown";
    }
}

// Size of the message header that follows the basic header
[[nodiscard]]
inline constexpr std::size_t message_header_size(HeaderFormat f) noexcept {
    switch (f) {
        case HeaderFormat::Full:                return 11;
        case HeaderFormat::SameStream:          return 7;
        case HeaderFormat::SameLengthAndStream: return 3;
        default:                                return 0;
    }
}

// Size of the basic header needed for a chunk stream id (1, 2 or 3 bytes)
[[nodiscard]]
inline constexpr std::size_t basic_header_size(std::uint32_t chunk_stream_id) noexcept {
    if (chunk_stream_id < 64)  return 1;
    if (chunk_stream_id < 320) return 2;
    return 3;
}

// Basic header (3) + full message header (11) + extended timestamp (4)
inline constexpr std::size_t MAX_HEADER_SIZE = 18;

} // namespace rtmpwire::core::chunk
