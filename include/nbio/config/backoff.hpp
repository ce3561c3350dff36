/*
================================================================================
Backoff Configuration
================================================================================

Purpose
-------
Defaults for nbio::Backoff, the adaptive sleep generator used by callers that
must wait for external readiness after observing WouldBlock.

Schedule
--------
Block k performs k waits of min(k * BASE, MAX). With the defaults:

    block 1 : 1 x 0.5ms
    block 2 : 2 x 1.0ms
    block 3 : 3 x 1.5ms
    ...
    block 200+ : capped at 100ms

Jitter
------
Each wait is scaled by (1 + (r - JITTER_BUCKETS/2) / JITTER_DIVISOR) where r is
drawn uniformly from [0, JITTER_BUCKETS). With 256 buckets and a divisor of
1024 this gives [-12.5%, +12.4%].

BASE matches the scale of local network round-trips. MAX bounds the worst-case
reaction latency once readiness returns.
================================================================================
*/
#pragma once

#include <chrono>
#include <cstdint>


namespace nbio::config::backoff {

inline constexpr std::chrono::nanoseconds DEFAULT_BASE = std::chrono::microseconds(500);
inline constexpr std::chrono::nanoseconds DEFAULT_MAX  = std::chrono::milliseconds(100);

inline constexpr std::int64_t JITTER_BUCKETS = 256;
inline constexpr std::int64_t JITTER_DIVISOR = 1024;

} // namespace nbio::config::backoff
