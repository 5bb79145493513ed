/// @file validator.hpp
/// @brief Read-only structural checks of a patch before anything is applied.

#pragma once

#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/pointer.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace docpatch_cpp {

/// Outcome of validating a patch. `errors` lists every problem found.
struct ValidationResult {
    bool is_valid{true};
    std::vector<std::string> errors;
};

/// Checks that a patch is legal before any inverse or apply work runs.
///
/// Per operation: `path` and `from` are well-formed pointers, "-" appears
/// only where add semantics allow it, the whole document is not removed,
/// a value is not moved into its own child, and nothing writes into the
/// audit log, the versioning metadata or the updated_at timestamp. Per patch: the operation count is
/// within the limit. Per document: the content is an object and the regions
/// the engine writes after a commit have the right shape.
///
/// Messages are prefixed with "operation <index>: " where they concern
/// a single operation.
class PatchValidator {
public:
    /// Throws std::invalid_argument if the options are invalid.
    explicit PatchValidator(const EngineOptions& options);

    auto validate(const Patch& patch, const Document& document) const -> ValidationResult;

    /// The operation-list checks alone, without looking at a document.
    auto validate(const Patch& patch) const -> ValidationResult;

    auto max_operations() const -> std::size_t { return max_operations_; }

private:
    void check_operation(std::size_t index, const Operation& op,
                         std::vector<std::string>& errors) const;
    void check_document(const Document& document, std::vector<std::string>& errors) const;

    std::size_t max_operations_;
    Pointer audit_;
    Pointer versioning_;
    Pointer updated_at_;
    bool record_versioning_;
};

}  // namespace docpatch_cpp
