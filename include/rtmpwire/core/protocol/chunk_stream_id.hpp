#pragma once

#include <cstdint>


namespace rtmpwire::core::protocol::chunk_stream {

// -----------------------------------------------------------------------------
// Reserved chunk stream ids
//
// 0 and 1 are basic-header markers and never name a stream.
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t Protocol    = 2;  // protocol control messages
inline constexpr std::uint32_t Command     = 3;  // connection / RPC commands
inline constexpr std::uint32_t UserControl = 4;

// Encodable range of the basic header
inline constexpr std::uint32_t Min = 2;
inline constexpr std::uint32_t Max = 65599;      // 64 + 0xFFFF

[[nodiscard]]
inline constexpr bool is_valid(std::uint32_t id) noexcept {
    return id >= Min && id <= Max;
}

} // namespace rtmpwire::core::protocol::chunk_stream
