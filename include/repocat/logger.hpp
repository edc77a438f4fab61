#pragma once

#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace repocat {

enum class LogLevel {
    Error = 0,
    Warn,
    Info,
    Debug,
    Trace,
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view value);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

    // nullptr restores std::clog.
    void set_stream(std::ostream* stream);

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level <= level_.load(std::memory_order_relaxed);
    }

    template <typename... Args>
    void log(LogLevel level, std::format_string<const Args&...> fmt, const Args&... args) {
        if (!enabled(level)) {
            return;
        }
        write(level, std::format(fmt, args...));
    }

    template <typename... Args>
    void error(std::format_string<const Args&...> fmt, const Args&... args) {
        log(LogLevel::Error, fmt, args...);
    }

    template <typename... Args>
    void warn(std::format_string<const Args&...> fmt, const Args&... args) {
        log(LogLevel::Warn, fmt, args...);
    }

    template <typename... Args>
    void info(std::format_string<const Args&...> fmt, const Args&... args) {
        log(LogLevel::Info, fmt, args...);
    }

    template <typename... Args>
    void debug(std::format_string<const Args&...> fmt, const Args&... args) {
        log(LogLevel::Debug, fmt, args...);
    }

    template <typename... Args>
    void trace(std::format_string<const Args&...> fmt, const Args&... args) {
        log(LogLevel::Trace, fmt, args...);
    }

private:
    Logger();

    void write(LogLevel level, std::string_view message);

    [[nodiscard]] static constexpr std::string_view to_string(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
        }
        return "INFO";
    }

    std::atomic<LogLevel> level_ { LogLevel::Error };
    std::ostream* stream_ { nullptr };
    std::mutex mutex_;
};

} // namespace repocat
