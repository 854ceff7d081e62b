#pragma once

#include <mutex>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>

namespace podkit {
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

// Maps a config string ("trace" | "debug" | "info" | "warn" | "error" | "fatal" | "off")
// to a level. Unknown strings fall back to Info.
[[nodiscard]] inline constexpr Level parse_level(std::string_view s) noexcept {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "warn")  return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    if (s == "off")   return Level::Off;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
// The library itself only reports decoding failures (Trace), sink failures
// (Warn) and contract violations (Fatal). The default level is Warn so that
// a healthy process stays silent.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    void set_level(std::string_view name) noexcept { level_ = parse_level(name); }

    Level level() const noexcept { return level_; }

    [[nodiscard]] bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level_;
    }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stderr-backed std::clog by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        const level_style& style = style_of(lvl);
        if (color_enabled_) os << style.color;
        os << timestamp() << " [" << style.name << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::clog),
          level_(Level::Warn),
          color_enabled_(false)
    {}

    struct level_style {
        const char* name;
        const char* color;
    };

    // Indexed by Level; Off never reaches the sink.
    static constexpr level_style styles_[] = {
        { "TRACE", "\033[37m"   },
        { "DEBUG", "\033[36m"   },
        { "INFO",  "\033[32m"   },
        { "WARN",  "\033[33m"   },
        { "ERROR", "\033[31m"   },
        { "FATAL", "\033[1;31m" },
    };

    static const level_style& style_of(Level lvl) noexcept {
        return styles_[static_cast<std::size_t>(lvl)];
    }

    // Local time with millisecond precision: "YYYY-MM-DD HH:MM:SS.mmm"
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
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
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
} // namespace podkit


// ---------------------------------------------------------
// Macros
// ---------------------------------------------------------
// The level check happens before the message is formatted, so disabled
// levels cost one comparison.
#define PK_LOG_LEVEL(lvl)                                              \
    if (!::podkit::log::Logger::instance().enabled((lvl))) {}          \
    else ::podkit::log::LogStream((lvl))

#define PK_TRACE(msg)  PK_LOG_LEVEL(::podkit::log::Level::Trace) << msg
#define PK_DEBUG(msg)  PK_LOG_LEVEL(::podkit::log::Level::Debug) << msg
#define PK_INFO(msg)   PK_LOG_LEVEL(::podkit::log::Level::Info)  << msg
#define PK_WARN(msg)   PK_LOG_LEVEL(::podkit::log::Level::Warn)  << msg
#define PK_ERROR(msg)  PK_LOG_LEVEL(::podkit::log::Level::Error) << msg
#define PK_FATAL(msg)  PK_LOG_LEVEL(::podkit::log::Level::Fatal) << msg
