#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <string_view>

#include "nbio/system/cpu_relax.hpp"


namespace nbio {

// ============================================================================
// Semantic Policy
// ============================================================================
//
// Engine detects semantic signals (WouldBlock / More).
// Policy classifies them per call site: Return or Retry.
// Engine executes mechanics (yield, resume, rollback).
// Caller owns strategy (which policy, what yield does).
//
// Retry always means: policy.yield(op), then resume from the same logical
// point without discarding confirmed progress.
//
// A null policy pointer means "never retry": signals surface immediately.
//
// Policies may hold per-operation state. Do not share one instance across
// concurrently running operations.
// ============================================================================

// ----------------------------------------------------------------------------
// Call sites
// ----------------------------------------------------------------------------
// Coarse on purpose: lets a policy tell reader-side from writer-side signals
// (e.g. writer-side More as a frame boundary).
enum class Op : std::uint8_t {
    CopyRead,
    CopyWrite,

    CopyWriterTo,
    CopyReaderFrom,

    TeeReaderRead,
    TeeReaderSideWrite,

    TeeWriterPrimaryWrite,
    TeeWriterTeeWrite,
};

enum class Action : std::uint8_t {
    Return,   // hand the signal to the caller (delivery boundary)
    Retry     // yield, then try again in place
};

std::string_view to_string(Op op) noexcept;
std::string_view to_string(Action action) noexcept;

// Write-side call sites: everything but the two pure reads.
[[nodiscard]]
inline constexpr bool is_write_side(Op op) noexcept {
    return op != Op::CopyRead && op != Op::TeeReaderRead;
}

// ============================================================================
// Semantic Policy Concept
// ============================================================================

template<typename P>
concept SemanticPolicy =
requires(P& p, Op op) {
    { p.yield(op) } -> std::same_as<void>;
    { p.on_would_block(op) } -> std::same_as<Action>;
    { p.on_more(op) } -> std::same_as<Action>;
};

// ============================================================================
// Semantic Policy Implementations
// ============================================================================

namespace policy {

using YieldFn    = std::function<void(Op)>;
using DecisionFn = std::function<Action(Op)>;

// Cooperative scheduler yield (std::this_thread::yield)
void default_yield(Op op) noexcept;

// ------------------------------------------------------------
// Return
// ------------------------------------------------------------
// Never waits, never retries.
// Behaves exactly like passing no policy.

struct Return {
    void yield(Op) noexcept {}

    Action on_would_block(Op) const noexcept { return Action::Return; }

    Action on_more(Op) const noexcept { return Action::Return; }
};


// ------------------------------------------------------------
// Yield
// ------------------------------------------------------------
// WouldBlock -> yield and retry
// More       -> return (delivery boundary: handle it, then copy again)

struct Yield {
    YieldFn yield_fn{};

    void yield(Op op) {
        if (yield_fn) {
            yield_fn(op);
            return;
        }
        default_yield(op);
    }

    Action on_would_block(Op) const noexcept { return Action::Retry; }

    Action on_more(Op) const noexcept { return Action::Return; }
};


// ------------------------------------------------------------
// YieldOnWriteWouldBlock
// ------------------------------------------------------------
// Retries only when the *writer side* would block.
// Reader-side WouldBlock goes back to the caller, whose event loop
// already feeds reads. Useful with a bounded output buffer.

struct YieldOnWriteWouldBlock {
    YieldFn yield_fn{};

    void yield(Op op) {
        if (yield_fn) {
            yield_fn(op);
            return;
        }
        default_yield(op);
    }

    Action on_would_block(Op op) const noexcept {
        return is_write_side(op) ? Action::Retry : Action::Return;
    }

    Action on_more(Op) const noexcept { return Action::Return; }
};


// ------------------------------------------------------------
// Func
// ------------------------------------------------------------
// Caller-supplied decisions. Empty members fall back to
// default_yield / Return.

struct Func {
    YieldFn    yield_fn{};
    DecisionFn would_block_fn{};
    DecisionFn more_fn{};

    void yield(Op op) {
        if (yield_fn) {
            yield_fn(op);
            return;
        }
        default_yield(op);
    }

    Action on_would_block(Op op) const {
        return would_block_fn ? would_block_fn(op) : Action::Return;
    }

    Action on_more(Op op) const {
        return more_fn ? more_fn(op) : Action::Return;
    }
};


// ------------------------------------------------------------
// Spin
// ------------------------------------------------------------
// WouldBlock -> bounded cpu_relax() spin and retry
// More       -> return
//
// For peers expected to become ready within microseconds
// (shared-memory rings, loopback). Burns a core while waiting.

template<unsigned Spins = 64>
struct Spin {
    static_assert(Spins > 0, "Spins must be > 0");

    void yield(Op) noexcept { system::cpu_relax(Spins); }

    Action on_would_block(Op) const noexcept { return Action::Retry; }

    Action on_more(Op) const noexcept { return Action::Return; }
};

} // namespace policy

static_assert(SemanticPolicy<policy::Return>);
static_assert(SemanticPolicy<policy::Yield>);
static_assert(SemanticPolicy<policy::YieldOnWriteWouldBlock>);
static_assert(SemanticPolicy<policy::Func>);
static_assert(SemanticPolicy<policy::Spin<>>);

} // namespace nbio
