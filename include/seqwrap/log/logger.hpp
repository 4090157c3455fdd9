#pragma once

#include <mutex>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace seqwrap {
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

// Human-readable severity names
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

// Parse a command line level name ("trace" | "debug" | "info" | "warn" | "error" | "fatal").
// Returns false and leaves `out` untouched on unknown names.
[[nodiscard]]
inline bool parse_level(std::string_view name, Level& out) noexcept {
    if      (name == "trace") out = Level::Trace;
    else if (name == "debug") out = Level::Debug;
    else if (name == "info")  out = Level::Info;
    else if (name == "warn")  out = Level::Warn;
    else if (name == "error") out = Level::Error;
    else if (name == "fatal") out = Level::Fatal;
    else return false;
    return true;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = lvl;
    }

    Level level() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool enabled(Level lvl) const noexcept {
        return lvl >= level();
    }

    void enable_color(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        color_enabled_ = on;
    }

    void enable_timestamp(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamp_enabled_ = on;
    }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lvl < level_) return;
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        if (timestamp_enabled_) os << timestamp() << " ";
        os << "[" << to_string(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m"; // reset
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false),
          timestamp_enabled_(true)
    {}

    // ANSI color mappings
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

    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    bool timestamp_enabled_;
    mutable std::mutex mutex_;
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
} // namespace seqwrap


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
// The message expression is evaluated only when the level is enabled.
#define SW_LOG_LEVEL(lvl, msg)                                                   \
    do {                                                                         \
        if (::seqwrap::log::Logger::instance().enabled((lvl))) {                 \
            ::seqwrap::log::LogStream((lvl)) << msg;                             \
        }                                                                        \
    } while (0)

#define SW_TRACE(msg)  SW_LOG_LEVEL(::seqwrap::log::Level::Trace, msg)
#define SW_DEBUG(msg)  SW_LOG_LEVEL(::seqwrap::log::Level::Debug, msg)
#define SW_INFO(msg)   SW_LOG_LEVEL(::seqwrap::log::Level::Info,  msg)
#define SW_WARN(msg)   SW_LOG_LEVEL(::seqwrap::log::Level::Warn,  msg)
#define SW_ERROR(msg)  SW_LOG_LEVEL(::seqwrap::log::Level::Error, msg)
#define SW_FATAL(msg)  SW_LOG_LEVEL(::seqwrap::log::Level::Fatal, msg)
