/*
===============================================================================
 TeeReader tests
===============================================================================

Count invariant: read() returns the number of bytes taken from the source,
whatever the side writer did.

Scope:
- Mirror on success, end-of-stream and semantic signals
- Side failure, side short write and side WouldBlock (with context)
- Copying through a TeeReader
===============================================================================
*/

#include <array>
#include <cerrno>
#include <span>
#include <string>

#include "nbio/copy.hpp"
#include "nbio/tee.hpp"
#include "nbio/stream/memory.hpp"
#include "common/mock_streams.hpp"
#include "common/test_check.hpp"

using namespace nbio;
using nbio::stream::MemoryReader;
using nbio::stream::MemoryWriter;
using nbio::test::ScriptedReader;
using nbio::test::ScriptedWriter;


void test_tee_reader_mirrors() {
    std::cout << "[TEST] TeeReader mirrors what it reads\n";

    MemoryReader src{"hello"};
    MemoryWriter side;
    auto tee = tee_reader(src, side);

    std::array<char, 16> buf{};
    Result r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 5);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(side.str() == "hello");
    TEST_CHECK(std::string(buf.data(), r.n) == "hello");

    r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 0);
    TEST_CHECK(r.err.is(Errc::EndOfStream));
    TEST_CHECK(side.str() == "hello");

    std::cout << "[TEST] OK\n";
}

void test_tee_reader_copy() {
    std::cout << "[TEST] copy through TeeReader\n";

    MemoryReader src{"stream me twice"};
    MemoryWriter side;
    MemoryWriter out;
    auto tee = tee_reader(src, side);

    Result r = copy(out, tee);
    TEST_CHECK(r.n == 15);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(out.str() == "stream me twice");
    TEST_CHECK(side.str() == "stream me twice");

    std::cout << "[TEST] OK\n";
}

void test_tee_reader_side_failure_keeps_count() {
    std::cout << "[TEST] TeeReader side failure keeps source count\n";

    MemoryReader src{"hello"};
    ScriptedWriter side;
    side.then(2, Error::from_errno(ENOSPC, "write"));
    auto tee = tee_reader(src, side);

    std::array<char, 16> buf{};
    Result r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 5);
    TEST_CHECK(r.err.is(Errc::Failure));
    TEST_CHECK(r.err.cause() == std::errc::no_space_on_device);
    TEST_CHECK(r.err.context().rfind("tee side write", 0) == 0);
    TEST_CHECK(side.data() == "he");
    TEST_CHECK(src.position() == 5);

    std::cout << "[TEST] OK\n";
}

void test_tee_reader_side_short_write() {
    std::cout << "[TEST] TeeReader side short write is ShortWrite\n";

    MemoryReader src{"hello"};
    ScriptedWriter side;
    side.then(3);
    auto tee = tee_reader(src, side);

    std::array<char, 16> buf{};
    Result r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 5);
    TEST_CHECK(r.err.is(Errc::ShortWrite));
    TEST_CHECK(r.err.context() == "tee side write");

    std::cout << "[TEST] OK\n";
}

void test_tee_reader_side_would_block() {
    std::cout << "[TEST] TeeReader side WouldBlock surfaces with context\n";

    MemoryReader src{"hello"};
    ScriptedWriter side;
    side.then(1, Errc::WouldBlock);
    auto tee = tee_reader(src, side);

    std::array<char, 16> buf{};
    Result r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 5);
    TEST_CHECK(is_would_block(r.err));
    TEST_CHECK(r.err.context() == "tee side write");

    std::cout << "[TEST] OK\n";
}

void test_tee_reader_read_conditions() {
    std::cout << "[TEST] TeeReader returns read-side condition after mirroring\n";

    ScriptedReader src;
    src.then("ab", Errc::More).then("cd", Errc::EndOfStream);
    MemoryWriter side;
    auto tee = tee_reader(src, side);

    std::array<char, 16> buf{};
    Result r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 2);
    TEST_CHECK(r.err.is(Errc::More));
    TEST_CHECK(side.str() == "ab");

    r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 2);
    TEST_CHECK(r.err.is(Errc::EndOfStream));
    TEST_CHECK(side.str() == "abcd");

    std::cout << "[TEST] OK\n";
}

void test_tee_reader_nothing_read() {
    std::cout << "[TEST] TeeReader (0, WouldBlock) leaves side untouched\n";

    ScriptedReader src;
    src.then("", Errc::WouldBlock);
    ScriptedWriter side;
    auto tee = tee_reader(src, side);

    std::array<char, 16> buf{};
    Result r = tee.read(std::span<char>(buf));
    TEST_CHECK(r.n == 0);
    TEST_CHECK(r.err.is(Errc::WouldBlock));
    TEST_CHECK(side.writes() == 0);

    std::cout << "[TEST] OK\n";
}


int main() {
    log::Logger::instance().set_level(log::Level::Off);

    test_tee_reader_mirrors();
    test_tee_reader_copy();
    test_tee_reader_side_failure_keeps_count();
    test_tee_reader_side_short_write();
    test_tee_reader_side_would_block();
    test_tee_reader_read_conditions();
    test_tee_reader_nothing_read();

    std::cout << "\n[ALL TEE READER TESTS PASSED]\n";
    return 0;
}
