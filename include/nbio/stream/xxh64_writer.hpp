#pragma once

#include <cstdint>
#include <memory>
#include <span>

#include "nbio/concepts.hpp"


struct XXH64_state_s;


namespace nbio::stream {

// ============================================================================
// Xxh64Writer
// ============================================================================
//
// Streaming XXH64 digest sink (xxHash). Accepts every byte offered, so it
// never makes a tee side write fail or block.
//
//   Xxh64Writer digest;
//   auto tee = nbio::tee_writer(out, digest);
//   nbio::copy(tee, in);
//   digest.digest();  // same value as XXH64(all bytes, seed)
// ============================================================================

class Xxh64Writer {
public:
    explicit Xxh64Writer(std::uint64_t seed = 0);
    ~Xxh64Writer();

    Xxh64Writer(Xxh64Writer&&) noexcept;
    Xxh64Writer& operator=(Xxh64Writer&&) noexcept;

    Xxh64Writer(const Xxh64Writer&) = delete;
    Xxh64Writer& operator=(const Xxh64Writer&) = delete;

    [[nodiscard]] Result write(std::span<const char> buf);

    // Digest of everything written since construction / last reset().
    // Does not end the stream: more writes may follow.
    [[nodiscard]] std::uint64_t digest() const;

    [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_; }

    void reset(std::uint64_t seed = 0);

private:
    struct StateDeleter {
        void operator()(XXH64_state_s* s) const noexcept;
    };

    std::unique_ptr<XXH64_state_s, StateDeleter> state_;
    std::uint64_t bytes_{0};
};

static_assert(Writer<Xxh64Writer>);

} // namespace nbio::stream
