#include <docpatch-cpp/log.hpp>

#include "timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

namespace docpatch_cpp {

namespace {

std::mutex g_stderr_mutex;

}  // anonymous namespace

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    if (name == "trace") return LogLevel::trace;
    if (name == "debug") return LogLevel::debug;
    if (name == "info") return LogLevel::info;
    if (name == "warn") return LogLevel::warn;
    if (name == "error") return LogLevel::error;
    if (name == "off") return LogLevel::off;
    return std::nullopt;
}

void stderr_sink(LogLevel level, std::string_view message) {
    auto line = detail::format_timestamp(std::chrono::system_clock::now());
    line += " [";
    line += to_string_view(level);
    line += "] ";
    line += message;
    line += '\n';

    auto lock = std::scoped_lock{g_stderr_mutex};
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
}

Logger::Logger(LogLevel min_level, LogSink sink)
    : min_level_{min_level}, sink_{std::move(sink)} {}

void Logger::log(LogLevel level, std::string_view message) const {
    if (!enabled(level)) return;
    if (sink_) {
        sink_(level, message);
    } else {
        stderr_sink(level, message);
    }
}

}  // namespace docpatch_cpp
