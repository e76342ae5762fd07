#pragma once

#include <cstddef>


namespace rtmpwire::core::config {

// -----------------------------------------------------------------------------
// Pipeline queue sizes
// -----------------------------------------------------------------------------

// Completed inbound messages waiting for the dispatch loop.
// SPSC ring: power of two, one slot reserved (127 usable).
inline constexpr std::size_t DISPATCH_RING_CAPACITY = 128;

// Outbound messages waiting for the send loop.
inline constexpr std::size_t OUTBOUND_QUEUE_CAPACITY = 100;

static_assert((DISPATCH_RING_CAPACITY & (DISPATCH_RING_CAPACITY - 1)) == 0,
              "DISPATCH_RING_CAPACITY must be a power of two");

} // namespace rtmpwire::core::config
