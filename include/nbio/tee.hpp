#pragma once

/*
===============================================================================
nbio — Tee Adapters
===============================================================================

TeeReader: a Reader that mirrors to a side Writer what it reads from a source.
TeeWriter: a Writer that mirrors to a side Writer what its primary accepted.

Count semantics
---------------
TeeReader returns the number of bytes read from the source, whatever the side
writer did. Those bytes are already consumed; reporting fewer would lose them.

TeeWriter returns the number of bytes the primary accepted, whatever the side
writer did. Retrying with buf.subspan(n) therefore never re-delivers bytes to
the primary.

An empty write to a TeeWriter returns (0, None) without calling the primary or
the side writer; there is nothing to deliver and nothing to mirror.

Error precedence
----------------
- Side-writer errors are returned with the context "tee side write" (kind
  preserved). A side write that takes less than offered without an error is
  ShortWrite.
- TeeReader: after the mirror completes, the read-side condition is returned
  unchanged (WouldBlock, More, EndOfStream, ...).
- TeeWriter: a side error wins over the primary error; otherwise the primary
  error; otherwise a short primary write is ShortWrite.

Policy-aware form
-----------------
Pass a policy pointer to retry the sub-operation that signalled:

  TeeReaderRead          read returned WouldBlock / More
  TeeReaderSideWrite     mirror write from TeeReader
  TeeWriterPrimaryWrite  primary write
  TeeWriterTeeWrite      mirror write from TeeWriter

Retries resume from the partial progress of that sub-operation. When a read
returned data together with a signal the policy retries, the data is handed to
the caller as (n, None) after yielding; the next read() continues.

A null policy is identical to the plain adapters.

Non-owning: source, primary and side writers must outlive the adapter.
===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>

#include "nbio/concepts.hpp"
#include "nbio/policy.hpp"
#include "nbio/semantics.hpp"
#include "nbio/log/logger.hpp"
#include "nbio/detail/copy_engine.hpp"


namespace nbio {

namespace detail {

inline constexpr std::string_view TEE_SIDE_CONTEXT = "tee side write";

// Writes all of `chunk` to `side`, retrying per policy. Returns success or
// the side error (with context).
template<Writer W, SemanticPolicy P>
[[nodiscard]] Error mirror(W& side, std::span<const char> chunk, P* policy, Op op) {
    std::size_t off = 0;
    while (off < chunk.size()) {
        Result r = side.write(chunk.subspan(off));
        const std::size_t accepted = std::min(r.n, chunk.size() - off);
        off += accepted;
        if (r.err) {
            if (is_semantic(r.err) && should_retry(policy, op, r.err)) {
                continue;
            }
            return r.err.with_context(TEE_SIDE_CONTEXT);
        }
        if (off < chunk.size()) {
            NBIO_WARN("[tee] side writer accepted " << accepted << " of "
                      << (chunk.size() - off + accepted) << " bytes without an error");
            return Error{Errc::ShortWrite}.with_context(TEE_SIDE_CONTEXT);
        }
    }
    return {};
}

} // namespace detail


// ============================================================================
// TeeReader
// ============================================================================

template<Reader R, Writer W, SemanticPolicy P = policy::Return>
class TeeReader {
public:
    TeeReader(R& source, W& side, P* policy = nullptr) noexcept
        : source_(&source)
        , side_(&side)
        , policy_(policy)
    {}

    [[nodiscard]]
    Result read(std::span<char> buf) {
        for (;;) {
            Result r = source_->read(buf);
            const std::size_t n = std::min(r.n, buf.size());

            if (n > 0) {
                Error side = detail::mirror(*side_, std::span<const char>(buf.data(), n),
                                            policy_, Op::TeeReaderSideWrite);
                if (side) {
                    return {n, std::move(side)};
                }
                if (is_semantic(r.err) && detail::should_retry(policy_, Op::TeeReaderRead, r.err)) {
                    return {n, {}};
                }
                return {n, std::move(r.err)};
            }

            if (is_semantic(r.err) && detail::should_retry(policy_, Op::TeeReaderRead, r.err)) {
                continue;
            }
            return {0, std::move(r.err)};
        }
    }

private:
    R* source_;
    W* side_;
    P* policy_;
};


// ============================================================================
// TeeWriter
// ============================================================================

template<Writer W, Writer T, SemanticPolicy P = policy::Return>
class TeeWriter {
public:
    TeeWriter(W& primary, T& side, P* policy = nullptr) noexcept
        : primary_(&primary)
        , side_(&side)
        , policy_(policy)
    {}

    // Empty input touches neither writer and returns (0, None).
    [[nodiscard]]
    Result write(std::span<const char> buf) {
        std::size_t off = 0;
        while (off < buf.size()) {
            Result r = primary_->write(buf.subspan(off));
            const std::size_t accepted = std::min(r.n, buf.size() - off);

            if (accepted > 0) {
                Error side = detail::mirror(*side_, buf.subspan(off, accepted),
                                            policy_, Op::TeeWriterTeeWrite);
                off += accepted;
                if (side) {
                    return {off, std::move(side)};
                }
            }

            if (r.err) {
                if (is_semantic(r.err) && detail::should_retry(policy_, Op::TeeWriterPrimaryWrite, r.err)) {
                    continue;
                }
                return {off, std::move(r.err)};
            }
            if (off < buf.size()) {
                NBIO_WARN("[tee] primary writer accepted " << accepted << " of "
                          << (buf.size() - off + accepted) << " bytes without an error");
                return {off, Errc::ShortWrite};
            }
        }
        return {off, {}};
    }

private:
    W* primary_;
    T* side_;
    P* policy_;
};


// ----------------------------------------------------------------------------
// Factories
// ----------------------------------------------------------------------------

template<Reader R, Writer W>
[[nodiscard]] TeeReader<R, W> tee_reader(R& source, W& side) noexcept {
    return TeeReader<R, W>{source, side};
}

template<Reader R, Writer W, SemanticPolicy P>
[[nodiscard]] TeeReader<R, W, P> tee_reader(R& source, W& side, P* policy) noexcept {
    return TeeReader<R, W, P>{source, side, policy};
}

template<Writer W, Writer T>
[[nodiscard]] TeeWriter<W, T> tee_writer(W& primary, T& side) noexcept {
    return TeeWriter<W, T>{primary, side};
}

template<Writer W, Writer T, SemanticPolicy P>
[[nodiscard]] TeeWriter<W, T, P> tee_writer(W& primary, T& side, P* policy) noexcept {
    return TeeWriter<W, T, P>{primary, side, policy};
}

} // namespace nbio
