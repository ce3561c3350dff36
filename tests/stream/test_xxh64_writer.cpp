/*
===============================================================================
 Xxh64Writer tests
===============================================================================

Scope:
- Streaming digest equals the one-shot XXH64 of the same bytes
- Known value for empty input
- reset() with and without a new seed
- Digest sink as the side writer of a tee during copy()
===============================================================================
*/

#include <span>
#include <string>
#include <utility>

#include <xxhash.h>

#include "nbio/copy.hpp"
#include "nbio/tee.hpp"
#include "nbio/stream/memory.hpp"
#include "nbio/stream/xxh64_writer.hpp"
#include "common/test_check.hpp"

using namespace nbio;
using nbio::stream::MemoryReader;
using nbio::stream::MemoryWriter;
using nbio::stream::Xxh64Writer;


void test_empty_digest() {
    std::cout << "[TEST] Xxh64Writer empty input\n";

    Xxh64Writer h;
    TEST_CHECK(h.bytes() == 0);
    TEST_CHECK(h.digest() == 0xEF46DB3751D8E999ULL);

    std::cout << "[TEST] OK\n";
}

void test_streaming_matches_one_shot() {
    std::cout << "[TEST] Xxh64Writer streaming == one-shot\n";

    const std::string text = "The quick brown fox jumps over the lazy dog";
    Xxh64Writer h;

    // Uneven chunks cross the 32-byte internal stripe
    std::span<const char> all(text.data(), text.size());
    TEST_CHECK(h.write(all.first(5)).n == 5);
    TEST_CHECK(h.write(all.subspan(5, 30)).n == 30);
    TEST_CHECK(h.write(all.subspan(35)).err.ok());

    TEST_CHECK(h.bytes() == text.size());
    TEST_CHECK(h.digest() == XXH64(text.data(), text.size(), 0));

    // digest() does not end the stream
    TEST_CHECK(h.write(std::span<const char>(text.data(), 3)).err.ok());
    const std::string longer = text + text.substr(0, 3);
    TEST_CHECK(h.digest() == XXH64(longer.data(), longer.size(), 0));

    std::cout << "[TEST] OK\n";
}

void test_reset_and_seed() {
    std::cout << "[TEST] Xxh64Writer reset with seed\n";

    const std::string text = "seeded";
    Xxh64Writer h{7};
    (void)h.write(std::span<const char>(text.data(), text.size()));
    TEST_CHECK(h.digest() == XXH64(text.data(), text.size(), 7));

    h.reset(99);
    TEST_CHECK(h.bytes() == 0);
    (void)h.write(std::span<const char>(text.data(), text.size()));
    TEST_CHECK(h.digest() == XXH64(text.data(), text.size(), 99));

    Xxh64Writer moved = std::move(h);
    TEST_CHECK(moved.digest() == XXH64(text.data(), text.size(), 99));

    std::cout << "[TEST] OK\n";
}

void test_digest_as_tee_side() {
    std::cout << "[TEST] Xxh64Writer as tee side during copy\n";

    std::string payload(70'000, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(i * 31);
    }

    MemoryReader src{payload};
    MemoryWriter out;
    Xxh64Writer digest;
    auto tee = tee_writer(out, digest);

    Result r = copy(tee, src);
    TEST_CHECK(r.n == payload.size());
    TEST_CHECK(r.err.ok());
    TEST_CHECK(out.str() == payload);
    TEST_CHECK(digest.bytes() == payload.size());
    TEST_CHECK(digest.digest() == XXH64(payload.data(), payload.size(), 0));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_empty_digest();
    test_streaming_matches_one_shot();
    test_reset_and_seed();
    test_digest_as_tee_side();

    std::cout << "\n[ALL XXH64 WRITER TESTS PASSED]\n";
    return 0;
}
