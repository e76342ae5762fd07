#pragma once

#include <thread>
#include <chrono>
#include <cstddef>
#include <utility>

#include "lcr/system/cpu_relax.hpp"

namespace lcr {

/**
 * Adaptive backoff loop.
 *
 * Template parameters:
 *   Op:  () -> bool       operation attempted repeatedly until success
 *   Stop: () -> bool      external stop predicate (e.g., shutdown flag)
 *
 * Returns:
 *   true  → operation succeeded
 *   false → stop condition activated before success
 *
 * The operation is always attempted before the stop predicate, so a
 * ready operation wins over a concurrent stop request.
 */
template <typename Op, typename Stop>
inline bool adaptive_backoff_until(
    Op&& op,
    Stop&& stop,
    size_t spin1 = 2000,       // Stage 1: pure CPU spin
    size_t spin2 = 10000,      // Stage 2: scheduler yield
    std::chrono::microseconds sleep_time = std::chrono::microseconds(100)
) noexcept
{
    size_t spins = 0;

    while (true) {
        // 1. Try the operation
        if (op()) [[likely]]
            return true;
        // 2. Stop condition
        if (stop()) [[unlikely]]
            return false;
        // 3. Adaptive backoff
        if (spins < spin1) {
            lcr::system::cpu_relax();
        }
        else if (spins < spin2) {
            std::this_thread::yield();
        }
        else { // Idle: give the core away
            std::this_thread::sleep_for(sleep_time);
        }

        ++spins;
    }
}

} // namespace lcr
