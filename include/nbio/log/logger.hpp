#pragma once

#include <atomic>
#include <mutex>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <chrono>

namespace nbio {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
//
// The copy engine runs on caller threads, so the level is read
// lock-free and only the sink is guarded.
//
// Default level is Warn: a library must not chatter on its own.
// Default sink is std::cerr: stdout may be the data destination.
//
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level();
    }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cerr;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << timestamp() << " [nbio] [" << level_name(lvl) << "] " << msg;
        if (color) os << "\033[0m";
        os << '\n';
        os.flush();
    }

private:
    Logger()
        : out_(&std::cerr),
          level_(Level::Warn),
          color_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   break;
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    // Millisecond resolution: retries and backoff waits are sub-second
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + len, sizeof(buf) - len, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace nbio


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
// The level is checked before the message is built, so disabled
// statements cost one relaxed load on the copy hot path.
#define NBIO_LOG_LEVEL(lvl)                                          \
    if (!::nbio::log::Logger::instance().enabled((lvl))) {} else     \
        ::nbio::log::LogStream((lvl))

#define NBIO_TRACE(msg)  NBIO_LOG_LEVEL(::nbio::log::Level::Trace) << msg
#define NBIO_DEBUG(msg)  NBIO_LOG_LEVEL(::nbio::log::Level::Debug) << msg
#define NBIO_INFO(msg)   NBIO_LOG_LEVEL(::nbio::log::Level::Info)  << msg
#define NBIO_WARN(msg)   NBIO_LOG_LEVEL(::nbio::log::Level::Warn)  << msg
#define NBIO_ERROR(msg)  NBIO_LOG_LEVEL(::nbio::log::Level::Error) << msg
#define NBIO_FATAL(msg)  NBIO_LOG_LEVEL(::nbio::log::Level::Fatal) << msg
