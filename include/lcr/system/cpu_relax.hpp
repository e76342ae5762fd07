#pragma once

#include <thread>  // std::this_thread::yield fallback


// -----------------------------------------------------------------------------
// Portable spin-wait hint
// x86 uses _mm_pause(), ARM the "yield" instruction, everything else falls
// back to std::this_thread::yield().
// -----------------------------------------------------------------------------
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    #include <immintrin.h> // _mm_pause
#endif


namespace lcr {
namespace system {

inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
}

} // namespace system
} // namespace lcr
