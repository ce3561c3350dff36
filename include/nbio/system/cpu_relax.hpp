#pragma once

#include <thread>  // std::this_thread::yield fallback


// -----------------------------------------------------------------------------
// Portable spin-wait hint
//
// Middle tier of the progress model:
//   1. direct system call        (the stream operation itself)
//   2. local hardware spin       (cpu_relax, policy::Spin)
//   3. adaptive software wait    (nbio::Backoff)
//
// _mm_pause() is an x86/x86-64 intrinsic; ARM uses the "yield" instruction.
// Other platforms fall back to std::this_thread::yield().
// -----------------------------------------------------------------------------
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    #include <immintrin.h> // _mm_pause
#endif


namespace nbio {
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

// Spin for a bounded number of relax hints.
inline void cpu_relax(unsigned spins) noexcept {
    for (unsigned i = 0; i < spins; ++i) {
        cpu_relax();
    }
}

} // namespace system
} // namespace nbio
