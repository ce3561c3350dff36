#include "nbio/error.hpp"


namespace nbio {

namespace {

std::string_view describe(Errc code) noexcept {
    switch (code) {
        case Errc::None:          return "success";
        case Errc::WouldBlock:    return "would block";
        case Errc::More:          return "expect more";
        case Errc::EndOfStream:   return "end of stream";
        case Errc::ShortWrite:    return "short write";
        case Errc::NoRollback:    return "unwritten bytes cannot be returned to a non-seekable source";
        case Errc::UnexpectedEnd: return "unexpected end of stream";
        case Errc::Failure:       return "failure";
    }
    return "unknown";
}

} // namespace


Error Error::with_context(std::string_view ctx) const {
    Error e{*this};
    if (ctx.empty()) {
        return e;
    }
    if (e.context_.empty()) {
        e.context_.assign(ctx);
    } else {
        std::string layered;
        layered.reserve(ctx.size() + 2 + e.context_.size());
        layered.append(ctx).append(": ").append(e.context_);
        e.context_ = std::move(layered);
    }
    return e;
}

std::string Error::message() const {
    std::string msg;
    if (!context_.empty()) {
        msg.append(context_).append(": ");
    }
    if (cause_) {
        msg.append(cause_.message());
    } else {
        msg.append(describe(code_));
    }
    return msg;
}

std::ostream& operator<<(std::ostream& os, const Error& err) {
    return os << to_string(err.code()) << " (" << err.message() << ")";
}

} // namespace nbio
