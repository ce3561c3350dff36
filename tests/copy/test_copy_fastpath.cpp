/*
===============================================================================
 nbio::copy direct-transfer tests
===============================================================================

Scope:
- write_to() on the source is preferred over read_from() on the destination
- read_from() is used when the source has no write_to()
- EndOfStream from a direct transfer maps to success
- Semantic signals and failures from a direct transfer pass through
- as_writer_to / as_reader_from adapters keep the engine's rollback
===============================================================================
*/

#include <cerrno>
#include <string>

#include "nbio/copy.hpp"
#include "nbio/adapters.hpp"
#include "nbio/stream/memory.hpp"
#include "common/mock_streams.hpp"
#include "common/test_check.hpp"

using namespace nbio;
using nbio::stream::MemoryReader;
using nbio::stream::MemoryWriter;
using nbio::test::ScriptedWriter;
using nbio::test::ScriptedWriterTo;
using nbio::test::ScriptedReaderFrom;
using nbio::test::PlainReader;


void test_writer_to_is_used() {
    std::cout << "[TEST] source write_to() is used\n";

    ScriptedWriterTo src;
    src.then("hello");
    MemoryWriter dst;

    Result r = copy(dst, src);
    TEST_CHECK(r.n == 5);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(src.calls() == 1);
    TEST_CHECK(src.reads() == 0);
    TEST_CHECK(dst.str() == "hello");

    std::cout << "[TEST] OK\n";
}

void test_writer_to_wins_over_reader_from() {
    std::cout << "[TEST] write_to() wins over read_from()\n";

    ScriptedWriterTo src;
    src.then("abc");
    ScriptedReaderFrom dst;
    dst.then(16);

    Result r = copy(dst, src);
    TEST_CHECK(r.n == 3);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(src.calls() == 1);
    TEST_CHECK(dst.calls() == 0);
    TEST_CHECK(dst.writes() == 1);

    std::cout << "[TEST] OK\n";
}

void test_reader_from_is_used() {
    std::cout << "[TEST] destination read_from() is used\n";

    PlainReader src{"hello"};
    ScriptedReaderFrom dst;
    dst.then(16);

    Result r = copy(dst, src);
    TEST_CHECK(r.n == 5);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(dst.calls() == 1);
    TEST_CHECK(dst.writes() == 0);
    TEST_CHECK(dst.data() == "hello");

    std::cout << "[TEST] OK\n";
}

void test_fast_path_end_of_stream_is_success() {
    std::cout << "[TEST] EndOfStream from write_to() is success\n";

    ScriptedWriterTo src;
    src.then("abc", Errc::EndOfStream);
    MemoryWriter dst;

    Result r = copy(dst, src);
    TEST_CHECK(r.n == 3);
    TEST_CHECK(r.err.ok());

    std::cout << "[TEST] OK\n";
}

void test_fast_path_signals_pass_through() {
    std::cout << "[TEST] direct-transfer signals pass through\n";

    {
        ScriptedWriterTo src;
        src.then("ab", Errc::WouldBlock).then("cd");
        MemoryWriter dst;

        Result r = copy(dst, src);
        TEST_CHECK(r.n == 2);
        TEST_CHECK(r.err.is(Errc::WouldBlock));
        TEST_CHECK(src.calls() == 1);
    }
    {
        MemoryReader src{"xyz"};
        ScriptedReaderFrom dst;
        dst.then(1, Errc::More);

        Result r = copy(dst, src);
        TEST_CHECK(r.n == 1);
        TEST_CHECK(r.err.is(Errc::More));
        TEST_CHECK(dst.data() == "x");
    }
    {
        ScriptedWriterTo src;
        src.then("a", Error::from_errno(ECONNRESET, "send"));
        MemoryWriter dst;

        Result r = copy(dst, src);
        TEST_CHECK(r.n == 1);
        TEST_CHECK(r.err.is(Errc::Failure));
        TEST_CHECK(r.err.cause() == std::errc::connection_reset);
    }

    std::cout << "[TEST] OK\n";
}

void test_as_writer_to_keeps_rollback() {
    std::cout << "[TEST] as_writer_to delegates to the copy engine\n";

    MemoryReader mem{"hello"};
    auto src = as_writer_to(mem);
    static_assert(WriterTo<decltype(src), ScriptedWriter>);

    ScriptedWriter dst;
    dst.then(2, Errc::WouldBlock);

    Result r = copy(dst, src);
    TEST_CHECK(r.n == 2);
    TEST_CHECK(r.err.is(Errc::WouldBlock));
    TEST_CHECK(mem.position() == 2);

    r = copy(dst, src);
    TEST_CHECK(r.n == 3);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(dst.data() == "hello");

    std::cout << "[TEST] OK\n";
}

void test_as_reader_from_delegates() {
    std::cout << "[TEST] as_reader_from delegates to the copy engine\n";

    PlainReader src{"payload"};
    MemoryWriter mem;
    auto dst = as_reader_from(mem);
    static_assert(ReaderFrom<decltype(dst), PlainReader>);

    Result r = copy(dst, src);
    TEST_CHECK(r.n == 7);
    TEST_CHECK(r.err.ok());
    TEST_CHECK(mem.str() == "payload");

    // Plain write still forwards
    std::string tail = "!";
    r = dst.write(std::span<const char>(tail.data(), tail.size()));
    TEST_CHECK(r.n == 1 && r.err.ok());
    TEST_CHECK(mem.str() == "payload!");

    std::cout << "[TEST] OK\n";
}


int main() {
    log::Logger::instance().set_level(log::Level::Off);

    test_writer_to_is_used();
    test_writer_to_wins_over_reader_from();
    test_reader_from_is_used();
    test_fast_path_end_of_stream_is_success();
    test_fast_path_signals_pass_through();
    test_as_writer_to_keeps_rollback();
    test_as_reader_from_delegates();

    std::cout << "\n[ALL COPY FAST PATH TESTS PASSED]\n";
    return 0;
}
