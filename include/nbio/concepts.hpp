/*
===============================================================================
Stream Concepts
===============================================================================

Defines the byte-stream contracts consumed by the copy engine and the tee
adapters. Capabilities are detected at compile time: no virtual dispatch, no
type erasure.

-------------------------------------------------------------------------------
Reader
-------------------------------------------------------------------------------

  Result read(std::span<char> buf)

  - 0 <= n <= buf.size()
  - (0, None) means *no progress*, NOT end-of-stream
  - (n > 0, err) delivers data and a condition together
  - end-of-stream is reported as Errc::EndOfStream

-------------------------------------------------------------------------------
Writer
-------------------------------------------------------------------------------

  Result write(std::span<const char> buf)

  - must report an error whenever n < buf.size(), except for empty input

-------------------------------------------------------------------------------
Optional capabilities
-------------------------------------------------------------------------------

  WriterTo<R, W>    r.write_to(W&)      source pushes itself into dst
  ReaderFrom<W, R>  w.read_from(R&)     destination pulls from src
  Seeker<S>         s.seek(int64_t)     relative seek, used only for rollback

Copy dispatch priority: WriterTo, then ReaderFrom, then the generic loop.
===============================================================================
*/
#pragma once

#include <concepts>
#include <cstdint>
#include <span>

#include "nbio/result.hpp"


namespace nbio {

template<class R>
concept Reader =
    requires(R& r, std::span<char> buf)
{
    { r.read(buf) } -> std::same_as<Result>;
};

template<class W>
concept Writer =
    requires(W& w, std::span<const char> buf)
{
    { w.write(buf) } -> std::same_as<Result>;
};

template<class S>
concept Seeker =
    requires(S& s, std::int64_t offset)
{
    { s.seek(offset) } -> std::same_as<SeekResult>;
};

template<class R, class W>
concept WriterTo =
    Reader<R> && Writer<W> &&
    requires(R& r, W& w)
{
    { r.write_to(w) } -> std::same_as<Result>;
};

template<class W, class R>
concept ReaderFrom =
    Writer<W> && Reader<R> &&
    requires(W& w, R& r)
{
    { w.read_from(r) } -> std::same_as<Result>;
};

} // namespace nbio
