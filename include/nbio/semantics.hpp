#pragma once

#include <cstdint>
#include <string_view>

#include "nbio/error.hpp"


namespace nbio {

/*
===============================================================================
 Outcome classification
===============================================================================

Ok          clean success, nothing more to come from this call
WouldBlock  no progress now; retry after readiness
More        progress happened; more completions will follow
Failure     anything else, including a bare EndOfStream (copy helpers absorb
            end-of-stream, the classifier does not reinterpret it)

All predicates inspect the kind tag only, so they see through any number of
Error::with_context() layers.
===============================================================================
*/

enum class Outcome : std::uint8_t {
    Failure,
    Ok,
    WouldBlock,
    More
};

std::string_view to_string(Outcome o) noexcept;


[[nodiscard]]
inline bool is_would_block(const Error& err) noexcept {
    return err.is(Errc::WouldBlock);
}

[[nodiscard]]
inline bool is_more(const Error& err) noexcept {
    return err.is(Errc::More);
}

// WouldBlock or More
[[nodiscard]]
inline bool is_semantic(const Error& err) noexcept {
    return is_would_block(err) || is_more(err);
}

// Keep the descriptor active without logging or tearing down.
[[nodiscard]]
inline bool is_non_failure(const Error& err) noexcept {
    return err.ok() || is_semantic(err);
}

// The call delivered usable progress now (success or More).
[[nodiscard]]
inline bool is_progress(const Error& err) noexcept {
    return err.ok() || is_more(err);
}

[[nodiscard]]
inline Outcome classify(const Error& err) noexcept {
    switch (err.code()) {
        case Errc::None:       return Outcome::Ok;
        case Errc::WouldBlock: return Outcome::WouldBlock;
        case Errc::More:       return Outcome::More;
        default:               return Outcome::Failure;
    }
}

} // namespace nbio
