/*
===============================================================================
 TeeWriter tests
===============================================================================

Count invariant: write() returns the number of bytes the primary accepted.
The side writer only ever sees that accepted prefix.

Scope:
- Mirror on success, empty input
- Primary partial write with WouldBlock / without error
- Side failure after a full primary write
- Side error wins over primary error
- Primary failure passes through, side untouched
===============================================================================
*/

#include <cerrno>
#include <span>
#include <string>
#include <string_view>

#include "nbio/copy.hpp"
#include "nbio/tee.hpp"
#include "nbio/stream/memory.hpp"
#include "common/mock_streams.hpp"
#include "common/test_check.hpp"

using namespace nbio;
using nbio::stream::MemoryReader;
using nbio::stream::MemoryWriter;
using nbio::test::ScriptedWriter;

namespace {

std::span<const char> bytes(std::string_view s) {
    return {s.data(), s.size()};
}

} // namespace


void test_tee_writer_mirrors() {
    std::cout << "[TEST] TeeWriter mirrors accepted bytes\n";

    MemoryWriter primary;
    MemoryWriter side;
    auto tee = tee_writer(primary, side);

    Result r = tee.write(bytes("hello"));
    TEST_CHECK(r.n == 5);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(primary.str() == "hello");
    TEST_CHECK(side.str() == "hello");

    std::cout << "[TEST] OK\n";
}

void test_tee_writer_empty_input() {
    std::cout << "[TEST] TeeWriter empty input\n";

    ScriptedWriter primary;
    ScriptedWriter side;
    auto tee = tee_writer(primary, side);

    Result r = tee.write(bytes(""));
    TEST_CHECK(r.n == 0);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(primary.writes() == 0);
    TEST_CHECK(side.writes() == 0);

    std::cout << "[TEST] OK\n";
}

void test_tee_writer_primary_would_block() {
    std::cout << "[TEST] TeeWriter primary partial + WouldBlock\n";

    ScriptedWriter primary;
    primary.then(3, Errc::WouldBlock);
    MemoryWriter side;
    auto tee = tee_writer(primary, side);

    Result r = tee.write(bytes("hello"));
    TEST_CHECK(r.n == 3);
    TEST_CHECK(r.err.is(Errc::WouldBlock));
    TEST_CHECK(side.str() == "hel");

    // Caller resumes with the remainder
    r = tee.write(bytes("hello").subspan(r.n));
    TEST_CHECK(r.n == 2);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(primary.data() == "hello");
    TEST_CHECK(side.str() == "hello");

    std::cout << "[TEST] OK\n";
}

void test_tee_writer_primary_short_write() {
    std::cout << "[TEST] TeeWriter primary short write is ShortWrite\n";

    ScriptedWriter primary;
    primary.then(3);
    MemoryWriter side;
    auto tee = tee_writer(primary, side);

    Result r = tee.write(bytes("hello"));
    TEST_CHECK(r.n == 3);
    TEST_CHECK(r.err.is(Errc::ShortWrite));
    TEST_CHECK(r.err.context().empty());
    TEST_CHECK(side.str() == "hel");

    std::cout << "[TEST] OK\n";
}

void test_tee_writer_side_failure_keeps_count() {
    std::cout << "[TEST] TeeWriter side failure keeps primary count\n";

    MemoryWriter primary;
    ScriptedWriter side;
    side.then(1, Error::from_errno(EBADF, "write"));
    auto tee = tee_writer(primary, side);

    Result r = tee.write(bytes("hello"));
    TEST_CHECK(r.n == 5);
    TEST_CHECK(r.err.is(Errc::Failure));
    TEST_CHECK(r.err.context().rfind("tee side write", 0) == 0);
    TEST_CHECK(primary.str() == "hello");
    TEST_CHECK(side.data() == "h");

    std::cout << "[TEST] OK\n";
}

void test_tee_writer_side_error_wins() {
    std::cout << "[TEST] TeeWriter side error wins over primary error\n";

    ScriptedWriter primary;
    primary.then(3, Errc::WouldBlock);
    ScriptedWriter side;
    side.then(0, Error::failure("side broke"));
    auto tee = tee_writer(primary, side);

    Result r = tee.write(bytes("hello"));
    TEST_CHECK(r.n == 3);
    TEST_CHECK(r.err.is(Errc::Failure));
    TEST_CHECK(r.err.context() == "tee side write: side broke");

    std::cout << "[TEST] OK\n";
}

void test_tee_writer_primary_failure() {
    std::cout << "[TEST] TeeWriter primary failure, side untouched\n";

    ScriptedWriter primary;
    primary.then(0, Error::from_errno(EPIPE, "write"));
    ScriptedWriter side;
    auto tee = tee_writer(primary, side);

    Result r = tee.write(bytes("hello"));
    TEST_CHECK(r.n == 0);
    TEST_CHECK(r.err.cause() == std::errc::broken_pipe);
    TEST_CHECK(r.err.context() == "write");
    TEST_CHECK(side.writes() == 0);

    std::cout << "[TEST] OK\n";
}

void test_copy_into_tee_writer() {
    std::cout << "[TEST] copy into TeeWriter\n";

    MemoryReader src{"fan out"};
    MemoryWriter primary;
    MemoryWriter side;
    auto tee = tee_writer(primary, side);

    Result r = copy(tee, src);
    TEST_CHECK(r.n == 7);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(primary.str() == "fan out");
    TEST_CHECK(side.str() == "fan out");

    std::cout << "[TEST] OK\n";
}


int main() {
    log::Logger::instance().set_level(log::Level::Off);

    test_tee_writer_mirrors();
    test_tee_writer_empty_input();
    test_tee_writer_primary_would_block();
    test_tee_writer_primary_short_write();
    test_tee_writer_side_failure_keeps_count();
    test_tee_writer_side_error_wins();
    test_tee_writer_primary_failure();
    test_copy_into_tee_writer();

    std::cout << "\n[ALL TEE WRITER TESTS PASSED]\n";
    return 0;
}
