#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

#include "nbio/concepts.hpp"


namespace nbio {

// ============================================================================
// LimitedReader
// ============================================================================
//
// Byte-limiting view over a Reader. Reports EndOfStream once `limit` bytes
// have been delivered, without touching the inner source again.
//
// Seekable when the inner source is. A relative seek is forwarded and the
// remaining budget moves with it, so a rollback inside copy_n() gives the
// returned bytes back to the budget as well as to the source.
//
// Non-owning: the inner reader must outlive the view.
// ============================================================================

template<Reader R>
class LimitedReader {
public:
    LimitedReader(R& inner, std::size_t limit) noexcept
        : inner_(&inner)
        , remaining_(limit)
    {}

    [[nodiscard]]
    Result read(std::span<char> buf) {
        if (remaining_ == 0) {
            return {0, Errc::EndOfStream};
        }
        if (buf.size() > remaining_) {
            buf = buf.first(remaining_);
        }
        Result r = inner_->read(buf);
        remaining_ -= std::min(r.n, remaining_);
        return r;
    }

    [[nodiscard]]
    SeekResult seek(std::int64_t offset) requires Seeker<R> {
        SeekResult r = inner_->seek(offset);
        if (!r.err) {
            if (offset < 0) {
                remaining_ += static_cast<std::size_t>(-offset);
            } else {
                remaining_ -= std::min(static_cast<std::size_t>(offset), remaining_);
            }
        }
        return r;
    }

    [[nodiscard]]
    std::size_t remaining() const noexcept {
        return remaining_;
    }

    [[nodiscard]]
    R& inner() noexcept {
        return *inner_;
    }

private:
    R* inner_;
    std::size_t remaining_;
};

} // namespace nbio
