#pragma once

#include <chrono>
#include <cstdint>

#include "nbio/config/backoff.hpp"


namespace nbio {

/*
================================================================================
Backoff
================================================================================

Purpose
-------
Adaptive sleep generator for callers that must wait for external readiness
after observing WouldBlock (buffer release, peer drain, ...). The copy engine
never calls it; a caller uses it directly or from a policy yield hook.

Progress tiers
--------------
  1. Strike : the system call itself          (direct kernel hit)
  2. Spin   : cpu_relax / policy::Spin        (local hardware)
  3. Adapt  : Backoff                         (external readiness)

Schedule
--------
Iterations are grouped into blocks. Block k performs k waits of

    min(k * base, max)  +/- 12.5% jitter

so the sleep grows linearly while the time spent at each step grows too
(triangular schedule). Jitter comes from a xorshift64 step and keeps
independent callers from waking in lockstep.

Lifecycle
---------
- Default construction is enough: base, max and the jitter seed are fixed on
  first use (base 500us, max 100ms, seed from the system clock).
- For reproducible jitter, construct with an explicit seed.
- State changes only through wait(), next(), reset() and the setters.
- current_block() / current_duration() describe the next wait, pre-jitter,
  without touching state.
- Call reset() after a productive operation.

Not thread-safe: one instance per waiting operation.
================================================================================
*/

class Backoff {
public:
    using duration = std::chrono::nanoseconds;

    Backoff() noexcept = default;

    Backoff(duration base, duration max) noexcept
        : base_(base)
        , max_(max)
    {}

    Backoff(duration base, duration max, std::uint64_t seed) noexcept
        : base_(base)
        , max_(max)
        , rng_(seed | 1)
    {}

    // Sleeps for the next jittered duration, then advances.
    void wait();

    // Same schedule as wait() without sleeping. Returns the jittered duration.
    [[nodiscard]] duration next() noexcept;

    // Back to block 1, zero progress into the block. Seed is kept.
    void reset() noexcept;

    [[nodiscard]] std::uint32_t current_block() const noexcept;

    [[nodiscard]] duration current_duration() const noexcept;

    // Non-positive values select the defaults.
    void set_base(duration d) noexcept { base_ = d; }
    void set_max(duration d) noexcept { max_ = d; }

    [[nodiscard]] duration base() const noexcept;
    [[nodiscard]] duration max() const noexcept;

private:
    void init() noexcept;
    [[nodiscard]] duration apply_jitter(duration d) noexcept;

    std::uint32_t block_{0};  // 0 = not yet initialized (reads as 1)
    std::uint32_t iter_{0};   // waits done inside current block
    duration base_{0};
    duration max_{0};
    std::uint64_t rng_{0};    // xorshift64 state, never 0 once initialized
};

} // namespace nbio
