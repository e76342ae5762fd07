#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

#include "rtmpwire/core/config/protocol.hpp"


namespace rtmpwire::core::protocol {

// Limit type carried by set-peer-bandwidth
enum class BandwidthLimit : uint8_t {
    Hard    = 0,
    Soft    = 1,
    Dynamic = 2
};

[[nodiscard]]
inline constexpr std::string_view to_string(BandwidthLimit l) noexcept {
    switch (l) {
        case BandwidthLimit::Hard:    return "Hard";
        case BandwidthLimit::Soft:    return "Soft";
        case BandwidthLimit::Dynamic: return "Dynamic";
        default:                      return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Negotiated per-connection parameters
//
// Written by the loop that learns them, read by any thread:
//   in_chunk_size     receive loop (peer chunk-size message)
//   out_chunk_size    send loop (after our chunk-size message is written)
//   in_window_size    dispatch loop (peer window-ack-size); we acknowledge per window
//   out_window_size   send loop (window we announced)
//   peer_bandwidth    dispatch loop (peer set-peer-bandwidth)
//   peer_acknowledged dispatch loop (peer acknowledgement sequence number)
// -----------------------------------------------------------------------------
struct Parameters {
    std::atomic<std::uint32_t> in_chunk_size{config::DEFAULT_CHUNK_SIZE};
    std::atomic<std::uint32_t> out_chunk_size{config::DEFAULT_CHUNK_SIZE};
    std::atomic<std::uint32_t> in_window_size{config::DEFAULT_WINDOW_SIZE};
    std::atomic<std::uint32_t> out_window_size{config::DEFAULT_WINDOW_SIZE};
    std::atomic<std::uint32_t> peer_bandwidth{config::DEFAULT_WINDOW_SIZE};
    std::atomic<BandwidthLimit> peer_bandwidth_limit{BandwidthLimit::Dynamic};
    std::atomic<std::uint32_t> peer_acknowledged{0};
};

} // namespace rtmpwire::core::protocol
