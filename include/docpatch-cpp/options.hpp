/// @file options.hpp
/// @brief Engine configuration.

#pragma once

#include <docpatch-cpp/log.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace docpatch_cpp {

/// Configuration for a PatchEngine.
///
/// The serializable subset (everything but `clock` and `log_sink`) can be
/// loaded from JSON with load_options() or nlohmann's `get<EngineOptions>()`.
struct EngineOptions {
    /// Largest accepted operation count per patch.
    std::size_t max_operations{100};

    /// Where the audit log array lives inside document content.
    std::string audit_pointer{"/audit"};

    /// Where the content_hash/previous_hash pair is mirrored.
    std::string versioning_pointer{"/meta/versioning"};

    /// Where the commit timestamp is mirrored. Excluded from the hash.
    std::string updated_at_pointer{"/meta/timestamps/updated_at"};

    /// Write the hash chain to `versioning_pointer` and the commit time to
    /// `updated_at_pointer` on every commit.
    bool record_versioning_metadata{true};

    LogLevel log_level{LogLevel::info};

    /// Source of audit timestamps. Empty means system_clock::now().
    std::function<std::chrono::system_clock::time_point()> clock{};

    /// Destination of log records. Empty means stderr_sink().
    LogSink log_sink{};
};

/// Throws std::invalid_argument if the options cannot drive an engine:
/// zero max_operations, malformed or root pointers, or any two of the
/// audit, versioning and updated_at regions overlapping.
void validate_options(const EngineOptions& options);

/// Read options from a JSON file. Missing members keep their defaults.
/// Throws std::runtime_error if the file cannot be read or names an unknown
/// log level, nlohmann's exceptions on malformed JSON, and
/// std::invalid_argument if the resulting options fail validate_options().
auto load_options(const std::filesystem::path& path) -> EngineOptions;

}  // namespace docpatch_cpp
