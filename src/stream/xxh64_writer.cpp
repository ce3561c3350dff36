#include "nbio/stream/xxh64_writer.hpp"

#include <new>

#include <xxhash.h>

#include "nbio/log/logger.hpp"


namespace nbio::stream {

void Xxh64Writer::StateDeleter::operator()(XXH64_state_s* s) const noexcept {
    XXH64_freeState(s);
}

Xxh64Writer::Xxh64Writer(std::uint64_t seed)
    : state_(XXH64_createState())
{
    if (!state_) {
        throw std::bad_alloc();
    }
    XXH64_reset(state_.get(), seed);
}

Xxh64Writer::~Xxh64Writer() = default;

Xxh64Writer::Xxh64Writer(Xxh64Writer&&) noexcept = default;

Xxh64Writer& Xxh64Writer::operator=(Xxh64Writer&&) noexcept = default;

Result Xxh64Writer::write(std::span<const char> buf) {
    if (buf.empty()) {
        return {};
    }
    if (XXH64_update(state_.get(), buf.data(), buf.size()) == XXH_ERROR) {
        NBIO_ERROR("[xxh64] update failed after " << bytes_ << " bytes");
        return {0, Error::failure("xxh64 update")};
    }
    bytes_ += buf.size();
    return {buf.size(), {}};
}

std::uint64_t Xxh64Writer::digest() const {
    return XXH64_digest(state_.get());
}

void Xxh64Writer::reset(std::uint64_t seed) {
    XXH64_reset(state_.get(), seed);
    bytes_ = 0;
}

} // namespace nbio::stream
