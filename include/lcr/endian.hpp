#pragma once

#include <cstdint>


// -------------------------------------------------------------
// Byte-order helpers for wire serialization
// -------------------------------------------------------------
// Explicit loads and stores on raw byte buffers, independent of host
// endianness. Network protocols are mostly BIG-ENDIAN; a few fields
// (e.g. RTMP message stream ids) are LITTLE-ENDIAN, hence both families.
// Buffers must hold at least the number of bytes named by the helper.
// -------------------------------------------------------------

namespace lcr {

// -------------------------------------------------------------
// Big-endian
// -------------------------------------------------------------
[[nodiscard]]
inline constexpr uint16_t load_be16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
}

[[nodiscard]]
inline constexpr uint32_t load_be24(const uint8_t* p) noexcept {
    return (uint32_t(p[0]) << 16) | (uint32_t(p[1]) << 8) | uint32_t(p[2]);
}

[[nodiscard]]
inline constexpr uint32_t load_be32(const uint8_t* p) noexcept {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline constexpr void store_be16(uint8_t* p, uint16_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}

// Only the low 24 bits of v are written
inline constexpr void store_be24(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 16);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v);
}

inline constexpr void store_be32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

// -------------------------------------------------------------
// Little-endian
// -------------------------------------------------------------
[[nodiscard]]
inline constexpr uint16_t load_le16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>(uint16_t(p[0]) | (uint16_t(p[1]) << 8));
}

[[nodiscard]]
inline constexpr uint32_t load_le32(const uint8_t* p) noexcept {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

inline constexpr void store_le16(uint8_t* p, uint16_t v) noexcept {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
}

inline constexpr void store_le32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

} // namespace lcr
