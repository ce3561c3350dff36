#pragma once

#include <cstddef>
#include <cstdint>

#include "nbio/error.hpp"


namespace nbio {

// -----------------------------------------------------------------------------
// Result
// -----------------------------------------------------------------------------
//
// Returned by every read, write, direct transfer and copy.
//
// Counts first, semantics second: a call may deliver n > 0 bytes *and* a
// non-success error in the same result (data plus WouldBlock, data plus
// EndOfStream, ...). Callers must consume n before looking at err.
//
struct Result {
    std::size_t n{0};
    Error err{};
};

// Relative seek outcome. pos is the new absolute position on success.
struct SeekResult {
    std::int64_t pos{0};
    Error err{};
};

} // namespace nbio
