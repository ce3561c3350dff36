#include "nbio/stream/fd.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "nbio/log/logger.hpp"


namespace nbio::stream {

namespace {

inline bool is_again(int err) noexcept {
    return err == EAGAIN || err == EWOULDBLOCK;
}

} // namespace


Error set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return Error::from_errno(errno, "fcntl(F_GETFL)");
    }
    if (flags & O_NONBLOCK) {
        return {};
    }
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return Error::from_errno(errno, "fcntl(F_SETFL)");
    }
    NBIO_DEBUG("[fd] descriptor " << fd << " set to non-blocking");
    return {};
}


NonblockingScope::NonblockingScope(int fd)
    : fd_(fd)
{
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
        err_ = Error::from_errno(errno, "fcntl(F_GETFL)");
        return;
    }
    if (flags & O_NONBLOCK) {
        return;
    }
    if (::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        err_ = Error::from_errno(errno, "fcntl(F_SETFL)");
        return;
    }
    saved_flags_ = flags;
    NBIO_DEBUG("[fd] descriptor " << fd_ << " non-blocking until scope exit");
}

NonblockingScope::~NonblockingScope() {
    if (saved_flags_ < 0) {
        return;
    }
    if (::fcntl(fd_, F_SETFL, saved_flags_) < 0) {
        NBIO_WARN("[fd] cannot restore flags of descriptor " << fd_ << ": "
                  << Error::from_errno(errno, "fcntl(F_SETFL)"));
        return;
    }
    NBIO_DEBUG("[fd] descriptor " << fd_ << " flags restored");
}


Result FdReader::read(std::span<char> buf) {
    if (buf.empty()) {
        return {};
    }
    for (;;) {
        const ssize_t rc = ::read(fd_, buf.data(), buf.size());
        if (rc > 0) {
            return {static_cast<std::size_t>(rc), {}};
        }
        if (rc == 0) {
            return {0, Errc::EndOfStream};
        }
        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (is_again(err)) {
            return {0, Errc::WouldBlock};
        }
        return {0, Error::from_errno(err, "read")};
    }
}

SeekResult FdReader::seek(std::int64_t offset) {
    const off_t pos = ::lseek(fd_, static_cast<off_t>(offset), SEEK_CUR);
    if (pos < 0) {
        const int err = errno;
        if (err == ESPIPE) {
            return {0, Error{Errc::NoRollback, std::error_code(err, std::generic_category()), "lseek"}};
        }
        return {0, Error::from_errno(err, "lseek")};
    }
    return {static_cast<std::int64_t>(pos), {}};
}


Result FdWriter::write(std::span<const char> buf) {
    std::size_t off = 0;
    while (off < buf.size()) {
        const ssize_t rc = ::write(fd_, buf.data() + off, buf.size() - off);
        if (rc > 0) {
            off += static_cast<std::size_t>(rc);
            continue;
        }
        if (rc == 0) {
            // POSIX leaves a zero return for a non-empty write unspecified.
            return {off, Errc::ShortWrite};
        }
        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (is_again(err)) {
            return {off, Errc::WouldBlock};
        }
        return {off, Error::from_errno(err, "write")};
    }
    return {off, {}};
}

} // namespace nbio::stream
