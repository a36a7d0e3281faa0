#include <statq/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string_view>
#include <vector>

namespace statq::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

namespace {

// "[Stats] Cycle detected" -> "Stats"
std::string extract_category(std::string_view message) {
    if (message.size() < 3 || message.front() != '[') return {};
    auto end = message.find(']');
    if (end == std::string_view::npos) return {};
    return std::string(message.substr(1, end - 1));
}

} // anonymous namespace

void log(LogLevel level, const char* message) {
    if (level < s_log_level.load(std::memory_order_relaxed)) return;
    if (!message) return;

    FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
    std::fprintf(stream, "%s\n", message);

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (s_log_sinks.empty()) return;

    std::string category = extract_category(message);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level.store(level, std::memory_order_relaxed);
}

LogLevel get_log_level() {
    return s_log_level.load(std::memory_order_relaxed);
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

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "Trace";
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
        case LogLevel::Fatal: return "Fatal";
    }
    return "Unknown";
}

} // namespace statq::core
