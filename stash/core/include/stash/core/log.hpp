#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stash::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

// Core entry points. Messages below the current level are dropped before
// reaching stdout or any sink.
void log(LogLevel level, const char* message);
void log_message(LogLevel level, std::string_view category, const std::string& message);

void set_log_level(LogLevel level);
LogLevel get_log_level();
bool is_log_enabled(LogLevel level);

const char* get_log_level_name(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view name);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

// ============================================================================
// Formatted logging
// ============================================================================

template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(level)) return;
    log_message(level, {}, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_trace(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Trace)) return;
    log_message(LogLevel::Trace, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_debug(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Debug)) return;
    log_message(LogLevel::Debug, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_info(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Info)) return;
    log_message(LogLevel::Info, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_warning(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Warn)) return;
    log_message(LogLevel::Warn, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(std::string_view category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Error)) return;
    log_message(LogLevel::Error, category, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace stash::core
