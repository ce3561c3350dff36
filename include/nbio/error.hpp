#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace nbio {

/*
===============================================================================
 nbio::Errc
===============================================================================

Kind tag carried by every nbio::Error.

Classification in nbio is done on this tag only. Context added on top of an
error (Error::with_context) never changes its kind, so a WouldBlock that went
through three adapters is still a WouldBlock.

Groups:

[semantic] WouldBlock and More are *not failures*. They are control-flow
signals for non-blocking and multi-shot I/O:

    WouldBlock  no progress is possible now; wait for readiness, then retry.
    More        progress happened; the operation remains active and more
                completions will follow. Process now, keep polling.

[terminal] EndOfStream is the clean end of a source. Copy helpers absorb it
into success; the classifier does not.

[contract] ShortWrite: a writer accepted fewer bytes than offered without
reporting why.

[recovery] NoRollback: bytes were read from a source, the destination did not
take all of them under a semantic signal, and the source cannot seek back.
The caller must not resume blindly.

[bounded] UnexpectedEnd: copy_n() stopped before the requested count.

[passthrough] Failure: anything else. The cause is available as a
std::error_code when the producer had one (errno, for instance).
===============================================================================
*/

enum class Errc : std::uint8_t {
    None = 0,

    // --- Semantic signals (non-failure) -------------------------------------
    WouldBlock,
    More,

    // --- Terminal -----------------------------------------------------------
    EndOfStream,

    // --- Contract / recovery ------------------------------------------------
    ShortWrite,
    NoRollback,
    UnexpectedEnd,

    // --- Passthrough --------------------------------------------------------
    Failure,
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Errc code) noexcept {
    switch (code) {
    case Errc::None:          return "None";
    case Errc::WouldBlock:    return "WouldBlock";
    case Errc::More:          return "More";
    case Errc::EndOfStream:   return "EndOfStream";
    case Errc::ShortWrite:    return "ShortWrite";
    case Errc::NoRollback:    return "NoRollback";
    case Errc::UnexpectedEnd: return "UnexpectedEnd";
    case Errc::Failure:       return "Failure";
    default:                  return "Unknown";
    }
}


// -----------------------------------------------------------------------------
// Error value
// -----------------------------------------------------------------------------
//
// Default-constructed Error is success. Converts to true when it carries
// anything else, mirroring std::error_code.
//
// Errors are values: nothing in nbio throws them.
//
class Error {
public:
    Error() noexcept = default;

    // Implicit so that stream code can `return {n, Errc::WouldBlock};`
    Error(Errc code) noexcept
        : code_(code)
    {}

    // Passthrough failure with an optional system cause.
    // An empty cause yields success.
    explicit Error(std::error_code cause, std::string context = {})
        : code_(cause ? Errc::Failure : Errc::None)
        , cause_(cause)
        , context_(std::move(context))
    {}

    // Explicit kind with a system cause attached, e.g. a refused seek
    // reported as NoRollback.
    Error(Errc code, std::error_code cause, std::string context = {})
        : code_(code)
        , cause_(cause)
        , context_(std::move(context))
    {}

    [[nodiscard]] static Error failure(std::string context) {
        Error e{Errc::Failure};
        e.context_ = std::move(context);
        return e;
    }

    [[nodiscard]] static Error from_errno(int err, std::string context = {}) {
        return Error{std::error_code(err, std::generic_category()), std::move(context)};
    }

    [[nodiscard]] Errc code() const noexcept { return code_; }

    [[nodiscard]] bool ok() const noexcept { return code_ == Errc::None; }

    explicit operator bool() const noexcept { return code_ != Errc::None; }

    [[nodiscard]] bool is(Errc code) const noexcept { return code_ == code; }

    [[nodiscard]] const std::error_code& cause() const noexcept { return cause_; }

    [[nodiscard]] const std::string& context() const noexcept { return context_; }

    // Adds an outer context layer. Kind and cause are preserved.
    [[nodiscard]] Error with_context(std::string_view ctx) const;

    // "outer: inner: <cause or kind description>"
    [[nodiscard]] std::string message() const;

    friend bool operator==(const Error& e, Errc code) noexcept {
        return e.code_ == code;
    }

private:
    Errc code_{Errc::None};
    std::error_code cause_{};
    std::string context_{};
};

std::ostream& operator<<(std::ostream& os, const Error& err);

} // namespace nbio
