#include <algorithm>
#include <deque>
#include <iostream>
#include <span>
#include <string>
#include <utility>

#include "nbio.hpp"

using namespace nbio;


// -----------------------------------------------------------------------------
// Multi-shot source
// -----------------------------------------------------------------------------
// Models a multi-shot receive: every completion delivers one frame together
// with More until the last one, which ends the stream.
class MultiShotSource {
public:
    explicit MultiShotSource(std::deque<std::string> frames)
        : frames_(std::move(frames))
    {}

    Result read(std::span<char> buf) {
        if (frames_.empty()) {
            return {0, Errc::EndOfStream};
        }
        std::string& frame = frames_.front();
        const std::size_t n = std::min(buf.size(), frame.size());
        frame.copy(buf.data(), n);
        frame.erase(0, n);
        if (!frame.empty()) {
            return {n, {}};
        }
        frames_.pop_front();
        return {n, frames_.empty() ? Error{Errc::EndOfStream} : Error{Errc::More}};
    }

private:
    std::deque<std::string> frames_;
};


int main() {
    log::Logger::instance().set_level(log::Level::Info);

    MultiShotSource src{{"frame-1|", "frame-2|", "frame-3|", "last"}};
    stream::MemoryWriter dst;

    // More is a delivery boundary: each copy() hands one frame to the caller,
    // who processes it and simply copies again.
    int calls = 0;
    for (;;) {
        Result r = copy(dst, src);
        ++calls;
        std::cout << "[nbio] copy #" << calls << " -> n=" << r.n
                  << " outcome=" << to_string(classify(r.err)) << std::endl;

        if (is_more(r.err)) {
            continue;
        }
        if (r.err) {
            std::cout << "[nbio] unexpected: " << r.err << std::endl;
            return 1;
        }
        break;
    }

    std::cout << "[nbio] received '" << dst.str() << "' in " << calls << " calls" << std::endl;
    return 0;
}
