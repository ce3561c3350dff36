#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "nbio/concepts.hpp"


namespace nbio::stream {

// ============================================================================
// MemoryReader
// ============================================================================
//
// Seekable source over a caller-owned byte range.
// Reports EndOfStream once drained (also for an empty buffer argument at
// the end). Relative seeks outside [0, size] fail and leave the position
// unchanged.
//
// Non-owning: the viewed bytes must outlive the reader.
// ============================================================================

class MemoryReader {
public:
    MemoryReader() noexcept = default;

    explicit MemoryReader(std::string_view data) noexcept
        : data_(data)
    {}

    [[nodiscard]]
    Result read(std::span<char> buf) noexcept {
        if (pos_ >= data_.size()) {
            return {0, Errc::EndOfStream};
        }
        const std::size_t n = std::min(buf.size(), data_.size() - pos_);
        if (n > 0) {
            std::memcpy(buf.data(), data_.data() + pos_, n);
            pos_ += n;
        }
        return {n, {}};
    }

    [[nodiscard]]
    SeekResult seek(std::int64_t offset) {
        const std::int64_t target = static_cast<std::int64_t>(pos_) + offset;
        if (target < 0 || target > static_cast<std::int64_t>(data_.size())) {
            return {static_cast<std::int64_t>(pos_),
                    Error{std::make_error_code(std::errc::invalid_argument), "memory seek out of range"}};
        }
        pos_ = static_cast<std::size_t>(target);
        return {target, {}};
    }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::string_view data_{};
    std::size_t pos_{0};
};


// ============================================================================
// MemoryWriter
// ============================================================================
//
// Growable sink. Accepts every byte offered.
// ============================================================================

class MemoryWriter {
public:
    [[nodiscard]]
    Result write(std::span<const char> buf) {
        if (buf.empty()) {
            return {};
        }
        data_.append(buf.data(), buf.size());
        return {buf.size(), {}};
    }

    [[nodiscard]] const std::string& str() const noexcept { return data_; }

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    void clear() noexcept { data_.clear(); }

private:
    std::string data_;
};

static_assert(Reader<MemoryReader>);
static_assert(Seeker<MemoryReader>);
static_assert(Writer<MemoryWriter>);

} // namespace nbio::stream
