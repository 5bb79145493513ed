/// @file log.hpp
/// @brief Leveled logging with a pluggable sink.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace docpatch_cpp {

/// Log severities, lowest first. `off` disables logging.
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warn,
    error,
    off,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace: return "trace";
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
        case LogLevel::off:   return "off";
    }
    return "unknown";
}

auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/// Receives one formatted record per call.
using LogSink = std::function<void(LogLevel, std::string_view)>;

/// The default sink: one line per record on stderr,
/// "2026-01-02T03:04:05.678Z [info] message".
void stderr_sink(LogLevel level, std::string_view message);

/// A logger value. Copies share nothing but the sink callable.
///
/// @code
/// auto log = Logger{LogLevel::debug};
/// log.info("document committed");
/// @endcode
class Logger {
public:
    Logger() = default;
    explicit Logger(LogLevel min_level, LogSink sink = {});

    auto level() const -> LogLevel { return min_level_; }
    void set_level(LogLevel level) { min_level_ = level; }

    auto enabled(LogLevel level) const -> bool {
        return level != LogLevel::off && level >= min_level_;
    }

    void log(LogLevel level, std::string_view message) const;

    void trace(std::string_view message) const { log(LogLevel::trace, message); }
    void debug(std::string_view message) const { log(LogLevel::debug, message); }
    void info(std::string_view message) const { log(LogLevel::info, message); }
    void warn(std::string_view message) const { log(LogLevel::warn, message); }
    void error(std::string_view message) const { log(LogLevel::error, message); }

private:
    LogLevel min_level_{LogLevel::info};
    LogSink sink_{};
};

}  // namespace docpatch_cpp
