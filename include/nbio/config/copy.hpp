/*
================================================================================
Copy Engine Configuration
================================================================================

Purpose
-------
Compile-time constants governing the buffered copy loop.

DEFAULT_BUFFER_SIZE:
    Size of the stack working buffer used by copy() / copy_n() when the caller
    does not supply one. Bounds every read issued by the generic loop.

Design Properties
-----------------
- Fully constexpr (no runtime configuration).
- The default buffer lives on the caller's stack frame: no allocation.

Callers that need a different size pass their own buffer to copy_buffer().
================================================================================
*/
#pragma once

#include <cstddef>


namespace nbio::config::copy {

inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 32 * 1024;

} // namespace nbio::config::copy
