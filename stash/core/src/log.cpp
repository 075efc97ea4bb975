#include <stash/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <vector>

namespace stash::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

void log(LogLevel level, const char* message) {
    log_message(level, {}, message ? std::string(message) : std::string{});
}

void log_message(LogLevel level, std::string_view category, const std::string& message) {
    if (!is_log_enabled(level)) return;

    if (category.empty()) {
        std::printf("[%s] %s\n", get_log_level_name(level), message.c_str());
    } else {
        std::printf("[%s] [%.*s] %s\n", get_log_level_name(level),
                    static_cast<int>(category.size()), category.data(), message.c_str());
    }

    // Forward to registered sinks
    std::string category_str(category);
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category_str, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
}

bool is_log_enabled(LogLevel level) {
    return level >= s_log_level.load();
}

const char* get_log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default:              return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

} // namespace stash::core
