#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <utility>

#include "nbio/concepts.hpp"
#include "nbio/config/copy.hpp"
#include "nbio/log/logger.hpp"
#include "nbio/policy.hpp"
#include "nbio/semantics.hpp"


namespace nbio::detail {

/*
===============================================================================
Copy engine internals
===============================================================================

One implementation serves both the plain and the policy-aware public API:
the plain forms pass a null policy, and a null policy never retries. That
makes "no policy" and "Return policy" observably identical by construction.

Byte accounting
---------------
`written` only ever grows by what the destination accepted. Bytes read but
not accepted are either re-offered (Retry), returned to the source (rollback)
or reported as unrecoverable (NoRollback / seek failure).
===============================================================================
*/

// Asks the policy about a semantic signal and yields when told to retry.
// Must only be called with WouldBlock or More.
template<SemanticPolicy P>
[[nodiscard]] inline bool should_retry(P* policy, Op op, const Error& err) {
    if (policy == nullptr) {
        return false;
    }
    const Action action = is_would_block(err) ? policy->on_would_block(op) : policy->on_more(op);
    if (action != Action::Retry) {
        return false;
    }
    NBIO_TRACE("[policy] retry " << to_string(op) << " after " << to_string(err.code()));
    policy->yield(op);
    return true;
}

// Aborts on a non-null, zero-length caller buffer. Silently copying nothing
// would hide the bug at the call site.
inline void require_usable_buffer(std::span<char> buf, const char* where) {
    if (buf.data() != nullptr && buf.empty()) [[unlikely]] {
        NBIO_FATAL("[copy] empty buffer passed to " << where);
        std::abort();
    }
}

// Returns `unwritten` bytes to the source after a partial write that ended
// in a semantic signal. On success the original signal is handed back.
template<Reader R>
[[nodiscard]] Error rollback(R& src, std::size_t unwritten, Error signal) {
    if constexpr (Seeker<R>) {
        SeekResult sr = src.seek(-static_cast<std::int64_t>(unwritten));
        if (sr.err) {
            // The seek failure wins: positions may now disagree.
            NBIO_WARN("[copy] rollback of " << unwritten << " bytes failed: " << sr.err);
            return std::move(sr.err);
        }
        NBIO_DEBUG("[copy] rolled back " << unwritten << " unwritten bytes on " << to_string(signal.code()));
        return signal;
    } else {
        NBIO_WARN("[copy] " << unwritten << " bytes read but not written on "
                  << to_string(signal.code()) << "; source cannot seek back");
        return Error{Errc::NoRollback};
    }
}

// Direct-transfer fast path (WriterTo / ReaderFrom).
// Retry re-invokes the same transfer; the running total carries over.
template<SemanticPolicy P, class Transfer>
[[nodiscard]] Result fast_path(Op op, P* policy, Transfer&& transfer) {
    std::size_t total = 0;
    for (;;) {
        Result r = transfer();
        total += r.n;
        if (!r.err || r.err.is(Errc::EndOfStream)) {
            return {total, {}};
        }
        if (is_semantic(r.err) && should_retry(policy, op, r.err)) {
            continue;
        }
        return {total, std::move(r.err)};
    }
}

// Generic buffered loop.
template<Writer W, Reader R, SemanticPolicy P>
[[nodiscard]] Result copy_loop(W& dst, R& src, std::span<char> buf, P* policy) {
    std::size_t written = 0;

    for (;;) {
        Result rd = src.read(buf);
        const std::size_t nr = std::min(rd.n, buf.size());

        if (nr > 0) {
            std::size_t off = 0;
            while (off < nr) {
                Result wr = dst.write(std::span<const char>(buf.data() + off, nr - off));
                const std::size_t accepted = std::min(wr.n, nr - off);
                off += accepted;
                written += accepted;

                if (wr.err) {
                    if (!is_semantic(wr.err)) {
                        return {written, std::move(wr.err)};
                    }
                    if (should_retry(policy, Op::CopyWrite, wr.err)) {
                        continue;
                    }
                    if (off < nr) {
                        return {written, rollback(src, nr - off, std::move(wr.err))};
                    }
                    return {written, std::move(wr.err)};
                }
                if (off < nr) {
                    NBIO_WARN("[copy] destination accepted " << accepted << " of "
                              << (nr - off + accepted) << " bytes without an error");
                    return {written, Errc::ShortWrite};
                }
            }
        }

        if (rd.err) {
            if (rd.err.is(Errc::EndOfStream)) {
                return {written, {}};
            }
            if (is_semantic(rd.err) && should_retry(policy, Op::CopyRead, rd.err)) {
                continue;
            }
            return {written, std::move(rd.err)};
        }

        // (0, None): stop here instead of spinning inside the helper.
        if (nr == 0) {
            return {written, {}};
        }
    }
}

// Capability dispatch: WriterTo, then ReaderFrom, then the generic loop.
// An empty `buf` (null data) selects the default stack buffer.
template<Writer W, Reader R, SemanticPolicy P>
[[nodiscard]] Result copy_dispatch(W& dst, R& src, std::span<char> buf, P* policy) {
    if constexpr (WriterTo<R, W>) {
        return fast_path(Op::CopyWriterTo, policy, [&] { return src.write_to(dst); });
    } else if constexpr (ReaderFrom<W, R>) {
        return fast_path(Op::CopyReaderFrom, policy, [&] { return dst.read_from(src); });
    } else {
        if (buf.data() == nullptr) {
            std::array<char, config::copy::DEFAULT_BUFFER_SIZE> local;
            return copy_loop(dst, src, std::span<char>(local), policy);
        }
        return copy_loop(dst, src, buf, policy);
    }
}

} // namespace nbio::detail
