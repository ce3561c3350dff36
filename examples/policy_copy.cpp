#include <algorithm>
#include <chrono>
#include <iostream>
#include <span>
#include <string>

#include "nbio.hpp"

using namespace nbio;


// -----------------------------------------------------------------------------
// Flaky sink
// -----------------------------------------------------------------------------
// Accepts at most `burst` bytes per call, then reports WouldBlock once.
class FlakySink {
public:
    explicit FlakySink(std::size_t burst)
        : burst_(burst)
    {}

    Result write(std::span<const char> buf) {
        ++calls_;
        if (blocked_) {
            blocked_ = false;
            return {0, Errc::WouldBlock};
        }
        const std::size_t n = std::min(burst_, buf.size());
        data_.append(buf.data(), n);
        if (n < buf.size()) {
            blocked_ = true;
            return {n, Errc::WouldBlock};
        }
        return {n, {}};
    }

    const std::string& data() const noexcept { return data_; }
    std::size_t calls() const noexcept { return calls_; }

private:
    std::size_t burst_;
    bool blocked_{false};
    std::string data_;
    std::size_t calls_{0};
};


int main() {
    log::Logger::instance().set_level(log::Level::Trace);

    const std::string text = "policies retry in place; the caller sees one clean result";

    // -------------------------------------------------------------------------
    // 1. policy::Yield: every WouldBlock is retried after a scheduler yield
    // -------------------------------------------------------------------------
    {
        stream::MemoryReader src{text};
        FlakySink sink{10};
        int yields = 0;
        policy::Yield p{[&](Op) { ++yields; }};

        Result r = copy(sink, src, &p);
        std::cout << "[nbio] Yield: n=" << r.n << " err=" << r.err
                  << " writes=" << sink.calls() << " yields=" << yields << std::endl;
    }

    // -------------------------------------------------------------------------
    // 2. policy::Func: retry the destination with a bounded Backoff, give up
    //    after a fixed number of waits and let the caller see WouldBlock.
    // -------------------------------------------------------------------------
    {
        stream::MemoryReader src{text};
        FlakySink sink{10};
        Backoff backoff{std::chrono::microseconds(20), std::chrono::microseconds(200)};
        int waits = 0;

        policy::Func p{
            [&](Op) { backoff.wait(); ++waits; },
            [&](Op op) { return op == Op::CopyWrite && waits < 4 ? Action::Retry : Action::Return; },
            {},
        };

        Result r = copy(sink, src, &p);
        std::cout << "[nbio] Func: n=" << r.n << " err=" << r.err
                  << " source at " << src.position() << " waits=" << waits << std::endl;

        // Rollback left the source exactly after the accepted bytes
        r = copy(sink, src, static_cast<policy::Yield*>(nullptr));
        while (is_would_block(r.err)) {
            r = copy(sink, src);
        }
        std::cout << "[nbio] Func: finished, intact=" << (sink.data() == text ? "yes" : "no") << std::endl;
    }

    return 0;
}
