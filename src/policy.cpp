#include "nbio/policy.hpp"

#include <thread>


namespace nbio {

std::string_view to_string(Op op) noexcept {
    switch (op) {
        case Op::CopyRead:              return "CopyRead";
        case Op::CopyWrite:             return "CopyWrite";
        case Op::CopyWriterTo:          return "CopyWriterTo";
        case Op::CopyReaderFrom:        return "CopyReaderFrom";
        case Op::TeeReaderRead:         return "TeeReaderRead";
        case Op::TeeReaderSideWrite:    return "TeeReaderSideWrite";
        case Op::TeeWriterPrimaryWrite: return "TeeWriterPrimaryWrite";
        case Op::TeeWriterTeeWrite:     return "TeeWriterTeeWrite";
    }
    return "Op(unknown)";
}

std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::Return: return "Return";
        case Action::Retry:  return "Retry";
    }
    return "Action(unknown)";
}

namespace policy {

void default_yield(Op) noexcept {
    std::this_thread::yield();
}

} // namespace policy

} // namespace nbio
