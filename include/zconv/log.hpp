#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace zconv {

enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel lvl) noexcept
{
    switch (lvl) {
        case LogLevel::trace: return "TRACE";
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO ";
        case LogLevel::warn:  return "WARN ";
        case LogLevel::error: return "ERROR";
        case LogLevel::fatal: return "FATAL";
        default:              return "?????";
    }
}

// --- Global logger (all-static, no instances) ---
//
// Every line is tagged with the component that produced it, e.g.
// "[DEBUG] [12:00:01] zconv.registry: registered convention 'license'".
class Logger final {
public:
    Logger() = delete;

    static void set_level(LogLevel level) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        level_() = level;
    }

    [[nodiscard]] static LogLevel level() noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        return level_();
    }

    [[nodiscard]] static bool enabled(LogLevel lvl) noexcept
    {
        return lvl != LogLevel::off &&
               static_cast<std::uint8_t>(lvl) >= static_cast<std::uint8_t>(level());
    }

    // Suppress the default stderr output (a sink still receives lines).
    static void set_stderr(bool enable) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        stderr_() = enable;
    }

    // Custom sink, called with the level and the formatted line.
    using Sink = std::function<void(LogLevel, std::string_view)>;
    static void set_sink(Sink sink)
    {
        auto lock = std::lock_guard{mutex_()};
        sink_() = std::move(sink);
    }

    template <typename... Args>
    static void log(LogLevel lvl, std::string_view component,
                    std::format_string<Args...> fmt, Args&&... args)
    {
        if (!enabled(lvl)) return;

        auto msg = std::format(fmt, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::floor<std::chrono::milliseconds>(now);
        auto dp = std::chrono::floor<std::chrono::days>(time);
        auto tod = std::chrono::hh_mm_ss{time - dp};

        auto line = std::format("[{}] [{:%H:%M:%S}] zconv.{}: {}\n",
                                log_level_name(lvl), tod, component, msg);

        auto lock = std::lock_guard{mutex_()};
        if (stderr_()) std::print(stderr, "{}", line);
        if (sink_()) sink_()(lvl, line);
    }

    template <typename... Args>
    static void trace(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::trace, component, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::debug, component, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::info, component, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::warn, component, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::error, component, fmt, std::forward<Args>(args)...);
    }

private:
    // Function-local statics: the registry may log during static init.
    static std::mutex& mutex_()
    {
        static std::mutex m;
        return m;
    }

    static LogLevel& level_()
    {
        static LogLevel lvl = LogLevel::info;
        return lvl;
    }

    static bool& stderr_()
    {
        static bool enabled = true;
        return enabled;
    }

    static Sink& sink_()
    {
        static Sink s;
        return s;
    }
};

class ScopedLogLevel final {
    LogLevel prev_;

public:
    explicit ScopedLogLevel(LogLevel level) noexcept
        : prev_{Logger::level()}
    {
        Logger::set_level(level);
    }

    ~ScopedLogLevel() noexcept { Logger::set_level(prev_); }

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;
    ScopedLogLevel(ScopedLogLevel&&) = delete;
    ScopedLogLevel& operator=(ScopedLogLevel&&) = delete;
};

} // namespace zconv
