#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace lcr {
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
    Fatal
};

[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal".
// Returns false (and leaves `out` untouched) on unknown names.
[[nodiscard]]
inline bool parse_level(std::string_view name, Level& out) noexcept {
    if (name == "trace")      { out = Level::Trace; return true; }
    if (name == "debug")      { out = Level::Debug; return true; }
    if (name == "info")       { out = Level::Info;  return true; }
    if (name == "warn")       { out = Level::Warn;  return true; }
    if (name == "error")      { out = Level::Error; return true; }
    if (name == "fatal")      { out = Level::Fatal; return true; }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
//
// The WebSocket receive thread and the session poll thread both
// log through this instance; every line is written under one lock.
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Enable or disable ANSI colored output
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << timestamp() << " [" << to_string(lvl) << "] " << msg;
        if (color) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout)
        , level_(Level::Info)
        , color_enabled_(true)
    {}

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    // Local wall-clock time with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::string out(buf, n);
        out += '.';
        out += static_cast<char>('0' + (ms / 100));
        out += static_cast<char>('0' + (ms / 10) % 10);
        out += static_cast<char>('0' + ms % 10);
        return out;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string, flushes on scope exit)
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
} // namespace lcr


// ---------------------------------------------------------
// Logging macros
//
// The level check happens before the message expression is evaluated,
// so disabled levels cost a single relaxed load.
// ---------------------------------------------------------
#define RA_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define RA_TRACE(msg)  RA_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define RA_DEBUG(msg)  RA_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define RA_INFO(msg)   RA_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define RA_WARN(msg)   RA_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define RA_ERROR(msg)  RA_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define RA_FATAL(msg)  RA_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
