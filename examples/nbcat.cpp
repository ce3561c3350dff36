#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <initializer_list>
#include <iostream>
#include <span>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "nbio.hpp"
#include "common/cli/nbcat_params.hpp"

using namespace nbio;


// -----------------------------------------------------------------------------
// nbcat
// -----------------------------------------------------------------------------
//
// cat(1) over non-blocking descriptors.
//
// The copy helper returns on every semantic signal the policy does not retry:
//
//   WouldBlock  -> wait for readiness (poll, or Backoff with --backoff), copy again
//   More        -> copy again
//   NoRollback  -> a partial write hit a non-seekable input; stop
//
// With --digest the output is a TeeWriter whose side is an XXH64 sink, so the
// digest covers exactly the bytes the output accepted.
// -----------------------------------------------------------------------------

namespace {

struct Descriptor {
    int fd{-1};
    bool owned{false};

    ~Descriptor() {
        if (owned && fd >= 0) {
            ::close(fd);
        }
    }
};

[[nodiscard]] bool open_input(const std::string& path, Descriptor& d) {
    if (path == "-") {
        d.fd = STDIN_FILENO;
        return true;
    }
    d.fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    d.owned = d.fd >= 0;
    if (d.fd < 0) {
        NBIO_ERROR("[nbcat] cannot open " << path << ": " << Error::from_errno(errno));
    }
    return d.fd >= 0;
}

[[nodiscard]] bool open_output(const std::string& path, Descriptor& d) {
    if (path == "-") {
        d.fd = STDOUT_FILENO;
        return true;
    }
    d.fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    d.owned = d.fd >= 0;
    if (d.fd < 0) {
        NBIO_ERROR("[nbcat] cannot create " << path << ": " << Error::from_errno(errno));
    }
    return d.fd >= 0;
}

// Blocks until either descriptor is ready, or 100ms pass.
void wait_ready(int in, int out) {
    pollfd fds[2] = {
        {in, POLLIN, 0},
        {out, POLLOUT, 0},
    };
    if (::poll(fds, 2, 100) < 0 && errno != EINTR) {
        NBIO_WARN("[nbcat] poll failed: " << Error::from_errno(errno));
    }
}

template<Writer W, SemanticPolicy P>
[[nodiscard]] Result run(W& dst, stream::FdReader& src, std::span<char> buf, P* policy,
                         const examples::cli::nbcat::Params& params, int out_fd) {
    Backoff backoff;
    std::size_t total = 0;

    for (;;) {
        Result r = copy_buffer(dst, src, buf, policy);
        total += r.n;

        if (r.n > 0) {
            backoff.reset();
        }

        switch (classify(r.err)) {
            case Outcome::Ok:
                return {total, {}};
            case Outcome::More:
                continue;
            case Outcome::WouldBlock:
                NBIO_TRACE("[nbcat] would block after " << total << " bytes");
                if (params.backoff) {
                    backoff.wait();
                } else {
                    wait_ready(src.fd(), out_fd);
                }
                continue;
            case Outcome::Failure:
                return {total, std::move(r.err)};
        }
    }
}

template<SemanticPolicy P>
[[nodiscard]] int copy_all(int in_fd, int out_fd, P* policy, const examples::cli::nbcat::Params& params) {
    stream::FdReader in{in_fd};
    stream::FdWriter out{out_fd};
    std::vector<char> buffer(params.buffer);
    std::span<char> buf(buffer);

    Result r;
    std::uint64_t digest = 0;
    if (params.digest) {
        stream::Xxh64Writer hash;
        auto tee = tee_writer(out, hash);
        r = run(tee, in, buf, policy, params, out_fd);
        digest = hash.digest();
    } else {
        r = run(out, in, buf, policy, params, out_fd);
    }

    if (r.err) {
        NBIO_ERROR("[nbcat] copy stopped after " << r.n << " bytes: " << r.err);
        return 1;
    }
    NBIO_INFO("[nbcat] copied " << r.n << " bytes");
    if (params.digest) {
        std::fprintf(stderr, "%016" PRIx64 "  %s\n", digest, params.input.c_str());
    }
    return 0;
}

} // namespace


int main(int argc, char** argv) {
    const auto params = examples::cli::nbcat::configure(argc, argv, "nbcat - non-blocking copy");
    if (log::Logger::instance().enabled(log::Level::Debug)) {
        params.dump("[nbcat] parameters", std::cerr);
    }

    Descriptor in;
    Descriptor out;
    if (!open_input(params.input, in) || !open_output(params.output, out)) {
        return 1;
    }

    // Declared after the descriptors: flags go back before any close, and
    // stdin/stdout are handed back to the shell in their original mode.
    stream::NonblockingScope in_mode{in.fd};
    stream::NonblockingScope out_mode{out.fd};
    for (const stream::NonblockingScope* mode : {&in_mode, &out_mode}) {
        if (mode->error()) {
            NBIO_ERROR("[nbcat] descriptor " << mode->fd() << ": " << mode->error());
            return 1;
        }
    }

    if (params.policy == "return") {
        policy::Return p;
        return copy_all(in.fd, out.fd, &p, params);
    }
    if (params.policy == "yield") {
        policy::Yield p;
        return copy_all(in.fd, out.fd, &p, params);
    }
    if (params.policy == "spin") {
        policy::Spin<> p;
        return copy_all(in.fd, out.fd, &p, params);
    }
    policy::YieldOnWriteWouldBlock p;
    return copy_all(in.fd, out.fd, &p, params);
}
