#include "nbio/semantics.hpp"


namespace nbio {

std::string_view to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Ok:         return "OK";
        case Outcome::WouldBlock: return "WouldBlock";
        case Outcome::More:       return "More";
        case Outcome::Failure:    return "Failure";
    }
    return "Failure";
}

} // namespace nbio
