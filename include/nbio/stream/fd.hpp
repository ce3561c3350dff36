#pragma once

#include <cstdint>
#include <span>

#include "nbio/concepts.hpp"


namespace nbio::stream {

/*
===============================================================================
POSIX descriptor streams
===============================================================================

Thin, non-owning wrappers that translate the kernel's non-blocking results
into nbio semantics:

  EAGAIN / EWOULDBLOCK   -> WouldBlock (with whatever was transferred so far)
  EINTR                  -> retried internally
  read() == 0            -> EndOfStream (non-empty buffer only)
  lseek() ESPIPE         -> NoRollback (pipes, sockets, terminals)
  other errno            -> Failure, cause = std::error_code(errno, generic)

The descriptor is neither opened nor closed here. Put it in non-blocking
mode with set_nonblocking() to get WouldBlock at all; on a blocking
descriptor these streams simply block.
===============================================================================
*/

// Sets O_NONBLOCK on `fd`.
[[nodiscard]] Error set_nonblocking(int fd);


// O_NONBLOCK for the lifetime of the scope.
//
// The flag belongs to the open file description, which inherited descriptors
// (stdin, stdout) share with the parent process. The previous flags are put
// back on destruction; a descriptor that was already non-blocking is left
// alone. Destroy the scope before closing the descriptor.
class NonblockingScope {
public:
    explicit NonblockingScope(int fd);
    ~NonblockingScope();

    NonblockingScope(const NonblockingScope&) = delete;
    NonblockingScope& operator=(const NonblockingScope&) = delete;

    // Failure to switch the mode; nothing is restored then.
    [[nodiscard]] const Error& error() const noexcept { return err_; }

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    int fd_;
    int saved_flags_{-1};
    Error err_{};
};


class FdReader {
public:
    explicit FdReader(int fd) noexcept
        : fd_(fd)
    {}

    [[nodiscard]] Result read(std::span<char> buf);

    // lseek(SEEK_CUR). On pipes, sockets and terminals ESPIPE comes back as
    // NoRollback, the same result the copy engine gives a source without seek.
    [[nodiscard]] SeekResult seek(std::int64_t offset);

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    int fd_;
};


class FdWriter {
public:
    explicit FdWriter(int fd) noexcept
        : fd_(fd)
    {}

    // Writes until `buf` is drained or the kernel refuses more.
    [[nodiscard]] Result write(std::span<const char> buf);

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    int fd_;
};

static_assert(Reader<FdReader>);
static_assert(Seeker<FdReader>);
static_assert(Writer<FdWriter>);

} // namespace nbio::stream
