#include "nbio/backoff.hpp"

#include <thread>

#include "nbio/log/logger.hpp"


namespace nbio {

void Backoff::init() noexcept {
    if (block_ == 0) {
        block_ = 1;
        iter_ = 0;
    }
    if (rng_ == 0) {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        rng_ = static_cast<std::uint64_t>(now) | 1;
    }
}

Backoff::duration Backoff::base() const noexcept {
    return base_ > duration::zero() ? base_ : config::backoff::DEFAULT_BASE;
}

Backoff::duration Backoff::max() const noexcept {
    return max_ > duration::zero() ? max_ : config::backoff::DEFAULT_MAX;
}

std::uint32_t Backoff::current_block() const noexcept {
    return block_ == 0 ? 1 : block_;
}

Backoff::duration Backoff::current_duration() const noexcept {
    const duration d = base() * current_block();
    const duration cap = max();
    return d > cap ? cap : d;
}

Backoff::duration Backoff::apply_jitter(duration d) noexcept {
    rng_ ^= rng_ << 13;
    rng_ ^= rng_ >> 7;
    rng_ ^= rng_ << 17;
    const std::int64_t r = static_cast<std::int64_t>((rng_ >> 32) % config::backoff::JITTER_BUCKETS);
    const std::int64_t factor = d.count() * (r - config::backoff::JITTER_BUCKETS / 2) / config::backoff::JITTER_DIVISOR;
    return d + duration(factor);
}

Backoff::duration Backoff::next() noexcept {
    init();

    const duration d = apply_jitter(current_duration());

    if (++iter_ >= block_) {
        iter_ = 0;
        ++block_;
    }
    return d;
}

void Backoff::wait() {
    const duration d = next();
    NBIO_TRACE("[backoff] sleeping " << d.count() << "ns (block " << current_block() << ")");
    std::this_thread::sleep_for(d);
}

void Backoff::reset() noexcept {
    block_ = 0;
    iter_ = 0;
}

} // namespace nbio
