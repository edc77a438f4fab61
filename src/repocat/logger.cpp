#include "repocat/logger.hpp"

#include <iostream>
#include <map>
#include <mutex>

namespace repocat {

namespace {
Logger* g_instance = nullptr;
std::once_flag g_logger_once;
}

std::optional<LogLevel> parse_log_level(std::string_view value) {
    static const std::map<std::string, LogLevel, std::less<>> table{
        {"error", LogLevel::Error},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"info", LogLevel::Info},
        {"debug", LogLevel::Debug},
        {"trace", LogLevel::Trace},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

Logger::Logger()
    : stream_(&std::clog) {}

Logger& Logger::instance() {
    std::call_once(g_logger_once, [] { g_instance = new Logger(); });
    return *g_instance;
}

void Logger::set_level(LogLevel level) noexcept {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept {
    return level_.load(std::memory_order_relaxed);
}

void Logger::set_stream(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    stream_ = stream != nullptr ? stream : &std::clog;
}

void Logger::write(LogLevel level, std::string_view message) {
    std::scoped_lock lock(mutex_);
    if (!stream_) {
        return;
    }
    *stream_ << '[' << to_string(level) << "] " << message << '\n';
}

} // namespace repocat
