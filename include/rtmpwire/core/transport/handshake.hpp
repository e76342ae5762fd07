#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <random>

#include "rtmpwire/core/config/protocol.hpp"
#include "rtmpwire/core/transport/stream_concept.hpp"
#include "rtmpwire/core/transport/io.hpp"
#include "rtmpwire/core/transport/error.hpp"
#include "lcr/endian.hpp"
#include "lcr/log/logger.hpp"


namespace rtmpwire::core::transport {

// -----------------------------------------------------------------------------
// Plain (version 3) handshake, client side
//
//   C0+C1  ->            version byte + 1536 bytes (time, zero, random)
//          <-  S0+S1     version must be 3
//   C2     ->            echo of S1
//          <-  S2        echo of C1 (not enforced)
//
// Runs on the calling thread before the pipeline starts.
// -----------------------------------------------------------------------------
template<class S>
    requires ByteReader<S> && ByteWriter<S>
[[nodiscard]]
inline Error handshake(S& stream) noexcept {
    constexpr std::size_t N = config::HANDSHAKE_PACKET_SIZE;
    RW_DEBUG("[HANDSHAKE] Sending C0+C1");

    // C0 + C1
    std::array<std::uint8_t, 1 + N> c0c1{};
    c0c1[0] = config::PROTOCOL_VERSION;
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    const auto epoch = static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    lcr::store_be32(c0c1.data() + 1, epoch);
    // bytes 5..8 stay zero
    std::mt19937 rng(static_cast<std::uint32_t>(now.count()));
    for (std::size_t i = 9; i < c0c1.size(); ++i) {
        c0c1[i] = static_cast<std::uint8_t>(rng());
    }
    auto err = write_all(stream, c0c1.data(), c0c1.size());
    if (err != Error::None) {
        RW_ERROR("[HANDSHAKE] Failed to send C0+C1");
        return err;
    }

    // S0 + S1
    std::array<std::uint8_t, 1 + N> s0s1{};
    err = read_exact(stream, s0s1.data(), s0s1.size());
    if (err != Error::None) {
        RW_ERROR("[HANDSHAKE] Failed to read S0+S1 (" << to_string(err) << ")");
        return (err == Error::TransportFailure) ? err : Error::HandshakeFailed;
    }
    if (s0s1[0] != config::PROTOCOL_VERSION) {
        RW_ERROR("[HANDSHAKE] Unsupported server version " << static_cast<int>(s0s1[0]));
        return Error::HandshakeFailed;
    }

    // C2 = echo of S1
    err = write_all(stream, s0s1.data() + 1, N);
    if (err != Error::None) {
        RW_ERROR("[HANDSHAKE] Failed to send C2");
        return err;
    }

    // S2
    std::array<std::uint8_t, N> s2{};
    err = read_exact(stream, s2.data(), s2.size());
    if (err != Error::None) {
        RW_ERROR("[HANDSHAKE] Failed to read S2 (" << to_string(err) << ")");
        return (err == Error::TransportFailure) ? err : Error::HandshakeFailed;
    }
    if (std::memcmp(s2.data() + 8, c0c1.data() + 9, N - 8) != 0) {
        RW_DEBUG("[HANDSHAKE] S2 does not echo C1 (tolerated)");
    }
    RW_INFO("[HANDSHAKE] Completed (server version " << static_cast<int>(s0s1[0]) << ")");
    return Error::None;
}

} // namespace rtmpwire::core::transport
