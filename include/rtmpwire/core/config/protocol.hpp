#pragma once

#include <cstddef>
#include <cstdint>


namespace rtmpwire::core::config {

// ============================================================================
// Wire-level protocol constants
//
// Values both peers assume before any negotiation takes place, plus the
// hard limits imposed by the header field widths.
// ============================================================================

// Chunk payload size in effect (both directions) until a chunk-size message
// renegotiates it.
inline constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 128;

// Initial acknowledgement window (bytes) assumed for both directions.
inline constexpr std::uint32_t DEFAULT_WINDOW_SIZE = 2'500'000;

// Message length is a 24-bit header field.
inline constexpr std::uint32_t MAX_MESSAGE_LENGTH = 0xFFFFFF;

// A chunk never needs to be larger than the largest message.
inline constexpr std::uint32_t MAX_CHUNK_SIZE = MAX_MESSAGE_LENGTH;

// 24-bit timestamp field value announcing a trailing 32-bit extended timestamp.
inline constexpr std::uint32_t TIMESTAMP_EXTENDED = 0xFFFFFF;

// Absolute timestamps above this value wrap back to zero.
inline constexpr std::uint32_t TIMESTAMP_MAX = 2'000'000'000;

// Plain handshake packet size (C1/C2/S1/S2).
inline constexpr std::size_t HANDSHAKE_PACKET_SIZE = 1536;

// Protocol version carried in C0/S0.
inline constexpr std::uint8_t PROTOCOL_VERSION = 3;

} // namespace rtmpwire::core::config
