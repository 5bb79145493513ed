/// @file error.hpp
/// @brief Error types for the docpatch-cpp library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docpatch_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    patch_validation,    ///< The operation list is structurally malformed.
    optimistic_lock,     ///< The caller's expected version is stale.
    inverse_generation,  ///< The pre-image does not admit an inverse.
    patch_application,   ///< An operation failed while being applied.
    invalid_document,    ///< The document data is malformed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::patch_validation:   return "patch_validation";
        case ErrorKind::optimistic_lock:    return "optimistic_lock";
        case ErrorKind::inverse_generation: return "inverse_generation";
        case ErrorKind::patch_application:  return "patch_application";
        case ErrorKind::invalid_document:   return "invalid_document";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The operation list is malformed. Carries every problem found, not just
/// the first one.
struct PatchValidationError {
    std::vector<std::string> errors;

    auto operator==(const PatchValidationError&) const -> bool = default;
};

/// The document moved on since the caller read it.
struct OptimisticLockError {
    std::int64_t expected{0};  ///< The version the caller declared.
    std::int64_t actual{0};    ///< The version the document is at.

    auto operator==(const OptimisticLockError&) const -> bool = default;
};

/// The pre-image cannot supply what is needed to invert an operation.
struct InverseGenerationError {
    std::size_t op_index{0};
    std::string reason;

    auto operator==(const InverseGenerationError&) const -> bool = default;
};

/// An operation failed at application time (test mismatch, vanished
/// source, out-of-range index, ...). The whole patch is discarded.
struct PatchApplicationError {
    std::size_t op_index{0};
    std::string reason;

    auto operator==(const PatchApplicationError&) const -> bool = default;
};

/// The input document cannot take a commit: its stored hash does not match
/// its content, or its version cannot be incremented.
struct InvalidDocumentError {
    std::string reason;

    auto operator==(const InvalidDocumentError&) const -> bool = default;
};

/// Every way a patch request can be rejected.
using PatchError = std::variant<
    PatchValidationError,
    OptimisticLockError,
    InverseGenerationError,
    PatchApplicationError,
    InvalidDocumentError
>;

/// The category of a PatchError.
auto kind_of(const PatchError& error) -> ErrorKind;

/// A single-line, human-readable description of a PatchError.
auto describe(const PatchError& error) -> std::string;

}  // namespace docpatch_cpp
