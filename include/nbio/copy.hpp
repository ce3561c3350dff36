#pragma once

/*
===============================================================================
nbio — Copy Engine
===============================================================================

copy(dst, src) moves bytes from a Reader to a Writer until end-of-stream, a
failure, or a semantic signal.

Extended result semantics
-------------------------
  (n, None)         source ended cleanly, or a read returned (0, None)
  (n, WouldBlock)   no progress possible now; wait for readiness, call again
  (n, More)         progress delivered; more completions will follow
  (n, ShortWrite)   destination accepted less than offered without a reason
  (n, NoRollback)   partial write under a signal, source not seekable
  (n, <other>)      passed through unchanged from source, destination or the
                    rollback seek

n is always the number of bytes the destination accepted.

A read that returns (0, None) stops the copy with success. This is not
end-of-stream: it keeps event-loop code from spinning inside a helper.

Rollback
--------
When the destination takes only part of a chunk and signals WouldBlock or
More, the unwritten bytes are returned to the source with seek(-unwritten)
so the next copy() resumes exactly after the last accepted byte.

Policy-aware forms
------------------
Every function has an overload with a trailing `P* policy`. At each point where
WouldBlock or More would be returned, the policy decides:

  Return -> same result as the plain form (including rollback)
  Retry  -> policy->yield(op), then resume in place

A null policy behaves exactly like the plain form.

Fast paths
----------
If the source provides write_to(dst) it is used; otherwise if the destination
provides read_from(src) it is used; otherwise the buffered loop runs.
EndOfStream from a fast path maps to success.
===============================================================================
*/

#include <cstddef>
#include <span>

#include "nbio/concepts.hpp"
#include "nbio/limited_reader.hpp"
#include "nbio/policy.hpp"
#include "nbio/detail/copy_engine.hpp"


namespace nbio {

namespace detail {

template<Writer W, Reader R, SemanticPolicy P>
[[nodiscard]] Result copy_n_impl(W& dst, R& src, std::size_t n, std::span<char> buf, P* policy) {
    if (n == 0) {
        return {};
    }

    LimitedReader<R> limited{src, n};
    Result r = copy_dispatch(dst, limited, buf, policy);

    if (r.n == n) {
        return {n, {}};
    }
    if (!r.err || r.err.is(Errc::EndOfStream)) {
        return {r.n, Errc::UnexpectedEnd};
    }
    return r;
}

} // namespace detail


// ----------------------------------------------------------------------------
// copy
// ----------------------------------------------------------------------------

template<Writer W, Reader R>
[[nodiscard]] Result copy(W& dst, R& src) {
    return detail::copy_dispatch(dst, src, std::span<char>{}, static_cast<policy::Return*>(nullptr));
}

template<Writer W, Reader R, SemanticPolicy P>
[[nodiscard]] Result copy(W& dst, R& src, P* policy) {
    return detail::copy_dispatch(dst, src, std::span<char>{}, policy);
}

// ----------------------------------------------------------------------------
// copy_buffer
// ----------------------------------------------------------------------------
// Stages through `buf` when the generic loop runs. An empty span
// (null data) selects the default stack buffer. A non-null, zero-length
// span is a programming error and aborts.

template<Writer W, Reader R>
[[nodiscard]] Result copy_buffer(W& dst, R& src, std::span<char> buf) {
    detail::require_usable_buffer(buf, "copy_buffer");
    return detail::copy_dispatch(dst, src, buf, static_cast<policy::Return*>(nullptr));
}

template<Writer W, Reader R, SemanticPolicy P>
[[nodiscard]] Result copy_buffer(W& dst, R& src, std::span<char> buf, P* policy) {
    detail::require_usable_buffer(buf, "copy_buffer");
    return detail::copy_dispatch(dst, src, buf, policy);
}

// ----------------------------------------------------------------------------
// copy_n
// ----------------------------------------------------------------------------
// Copies exactly n bytes. On return, r.n == n if and only if !r.err.
// Falling short with success or EndOfStream yields UnexpectedEnd; any
// other error passes through with the partial count.
// The destination's read_from() is preferred; the limited view never
// exposes the source's write_to().

template<Writer W, Reader R>
[[nodiscard]] Result copy_n(W& dst, R& src, std::size_t n) {
    return detail::copy_n_impl(dst, src, n, std::span<char>{}, static_cast<policy::Return*>(nullptr));
}

template<Writer W, Reader R, SemanticPolicy P>
[[nodiscard]] Result copy_n(W& dst, R& src, std::size_t n, P* policy) {
    return detail::copy_n_impl(dst, src, n, std::span<char>{}, policy);
}

template<Writer W, Reader R>
[[nodiscard]] Result copy_n_buffer(W& dst, R& src, std::size_t n, std::span<char> buf) {
    if (n == 0) {
        return {};
    }
    detail::require_usable_buffer(buf, "copy_n_buffer");
    return detail::copy_n_impl(dst, src, n, buf, static_cast<policy::Return*>(nullptr));
}

template<Writer W, Reader R, SemanticPolicy P>
[[nodiscard]] Result copy_n_buffer(W& dst, R& src, std::size_t n, std::span<char> buf, P* policy) {
    if (n == 0) {
        return {};
    }
    detail::require_usable_buffer(buf, "copy_n_buffer");
    return detail::copy_n_impl(dst, src, n, buf, policy);
}

} // namespace nbio
