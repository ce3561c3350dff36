#pragma once

#include <span>

#include "nbio/concepts.hpp"
#include "nbio/copy.hpp"


namespace nbio {

// ============================================================================
// Capability adapters
// ============================================================================
//
// Give a plain stream the direct-transfer capability, implemented with the
// nbio copy engine so WouldBlock / More / rollback semantics are kept.
//
// Typical use: a library entry point that only speaks WriterTo / ReaderFrom
// needs to be fed from a plain Reader or Writer.
//
// Non-owning.
// ============================================================================

template<Reader R>
class WriterToAdapter {
public:
    explicit WriterToAdapter(R& inner) noexcept
        : inner_(&inner)
    {}

    [[nodiscard]]
    Result read(std::span<char> buf) {
        return inner_->read(buf);
    }

    template<Writer W>
    [[nodiscard]] Result write_to(W& dst) {
        return nbio::copy(dst, *inner_);
    }

private:
    R* inner_;
};


template<Writer W>
class ReaderFromAdapter {
public:
    explicit ReaderFromAdapter(W& inner) noexcept
        : inner_(&inner)
    {}

    [[nodiscard]]
    Result write(std::span<const char> buf) {
        return inner_->write(buf);
    }

    template<Reader R>
    [[nodiscard]] Result read_from(R& src) {
        return nbio::copy(*inner_, src);
    }

private:
    W* inner_;
};


template<Reader R>
[[nodiscard]] WriterToAdapter<R> as_writer_to(R& r) noexcept {
    return WriterToAdapter<R>{r};
}

template<Writer W>
[[nodiscard]] ReaderFromAdapter<W> as_reader_from(W& w) noexcept {
    return ReaderFromAdapter<W>{w};
}

} // namespace nbio
