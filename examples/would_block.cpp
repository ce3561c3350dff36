#include <algorithm>
#include <chrono>
#include <iostream>
#include <span>
#include <string>

#include "nbio.hpp"

using namespace nbio;


// -----------------------------------------------------------------------------
// Bounded sink
// -----------------------------------------------------------------------------
// A destination with a small fixed window. It accepts what fits and reports
// WouldBlock for the rest until the consumer drains it.
class BoundedSink {
public:
    explicit BoundedSink(std::size_t capacity)
        : capacity_(capacity)
    {}

    Result write(std::span<const char> buf) {
        const std::size_t room = capacity_ - pending_.size();
        const std::size_t n = std::min(room, buf.size());
        pending_.append(buf.data(), n);
        if (n < buf.size()) {
            return {n, Errc::WouldBlock};
        }
        return {n, {}};
    }

    // Consumer side: hand everything buffered so far to `out`.
    void drain(std::string& out) {
        out += pending_;
        pending_.clear();
    }

private:
    std::size_t capacity_;
    std::string pending_;
};


int main() {
    log::Logger::instance().set_level(log::Level::Debug);

    const std::string message = "non-blocking copies never lose bytes";
    stream::MemoryReader src{message};
    BoundedSink sink{8};
    std::string delivered;

    Backoff backoff{std::chrono::microseconds(50), std::chrono::milliseconds(1)};

    for (;;) {
        Result r = copy(sink, src);
        std::cout << "[nbio] copy -> n=" << r.n << " err=" << r.err
                  << " (source at " << src.position() << ")" << std::endl;

        if (!r.err) {
            break;
        }
        if (!is_would_block(r.err)) {
            std::cout << "[nbio] copy failed: " << r.err << std::endl;
            return 1;
        }

        // Readiness arrives when the consumer drains the window.
        backoff.wait();
        sink.drain(delivered);
    }
    sink.drain(delivered);

    std::cout << "[nbio] delivered: '" << delivered << "'" << std::endl;
    return delivered == message ? 0 : 1;
}
