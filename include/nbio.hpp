#pragma once

/*
===============================================================================
nbio — Public API Entry Point
===============================================================================

Non-blocking stream copy helpers.

  nbio::copy / copy_buffer / copy_n / copy_n_buffer
      Reader -> Writer transfer that surfaces WouldBlock and More as
      control-flow signals and rolls back partially written chunks.

  nbio::policy::*
      Per-call-site retry decisions for the same helpers.

  nbio::tee_reader / tee_writer
      Duplication adapters with byte-exact count semantics.

  nbio::Backoff
      Adaptive, jittered wait for external readiness.

  nbio::stream::*
      Memory, POSIX descriptor and XXH64 digest streams.

Everything lives in namespace nbio. Names under nbio::detail are not part of
the public API.
===============================================================================
*/

#include <nbio/error.hpp>
#include <nbio/result.hpp>
#include <nbio/semantics.hpp>
#include <nbio/concepts.hpp>
#include <nbio/policy.hpp>
#include <nbio/copy.hpp>
#include <nbio/tee.hpp>
#include <nbio/adapters.hpp>
#include <nbio/limited_reader.hpp>
#include <nbio/backoff.hpp>
#include <nbio/stream/memory.hpp>
#include <nbio/stream/fd.hpp>
#include <nbio/stream/xxh64_writer.hpp>
