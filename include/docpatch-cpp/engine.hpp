/// @file engine.hpp
/// @brief The patch engine: version check, validation, inverse, apply, hash, audit.

#pragma once

#include <docpatch-cpp/audit.hpp>
#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/hasher.hpp>
#include <docpatch-cpp/log.hpp>
#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/validator.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docpatch_cpp {

/// A request to patch one document.
struct PatchRequest {
    std::int64_t document_version{0};  ///< The version the caller read.
    Patch patch;
    std::vector<std::string> evidence;
    bool dry_run{false};
    std::optional<std::string> actor;
};

/// What a successful request produced.
struct PatchResult {
    bool success{true};
    std::int64_t new_version{0};  ///< Unchanged from the input on a dry run.
    std::string content_hash;     ///< The hash the patched content has (or would have).
    Patch inverse_patch;          ///< Undoes the patch when applied to the new content.
    std::string applied_at;       ///< ISO-8601 UTC, milliseconds.
    bool dry_run{false};

    auto operator==(const PatchResult&) const -> bool = default;
};

struct PatchOutcome {
    Document document;  ///< The new snapshot, or the input itself on a dry run.
    PatchResult result;
};

struct BatchOutcome {
    Document document;
    std::vector<Patch> inverse_patches;  ///< Rollback order: last batch first.
};

/// Applies patches to documents.
///
/// The engine holds only its configuration. Every call works on the
/// document it is given and returns a new snapshot, so one engine can be
/// shared by any number of threads. A rejected request never changes
/// anything: the caller keeps the document it passed in.
///
/// @code
/// auto engine = PatchEngine{};
/// auto doc = engine.create_document(Value{Object{{"field", 1}}});
/// auto outcome = engine.apply(*doc, PatchRequest{
///     .document_version = doc->version,
///     .patch = {ReplaceOp{"/field", 2}},
/// });
/// // outcome->document.version == 2
/// // outcome->result.inverse_patch == Patch{ReplaceOp{"/field", 1}}
/// @endcode
class PatchEngine {
public:
    PatchEngine();

    /// Throws std::invalid_argument if the options are invalid.
    explicit PatchEngine(EngineOptions options);

    auto options() const -> const EngineOptions& { return options_; }
    auto hasher() const -> const ContentHasher& { return hasher_; }

    /// Version 1 of a document with its hash computed.
    auto create_document(Value content) const -> Result<Document, Error>;

    /// True if the stored hash matches the content.
    auto verify(const Document& document) const -> bool;

    auto validate(const Patch& patch, const Document& document) const -> ValidationResult;

    /// Run one request. The input document is never modified.
    ///
    /// Before any work the document itself is checked: its stored hash must
    /// match its content and its version must leave room for a commit.
    /// Either failure is an InvalidDocumentError, dry run or not.
    auto apply(const Document& document, const PatchRequest& request) const
        -> Result<PatchOutcome, PatchError>;

    /// Run one request and, on success, replace `document` with the new
    /// snapshot. On failure `document` is untouched.
    auto apply_in_place(Document& document, const PatchRequest& request) const
        -> Result<PatchResult, PatchError>;

    /// Apply several patches in order as one unit: one version and one audit
    /// entry per batch, all or nothing. Every batch's size is checked before
    /// any is applied.
    auto apply_batches(const Document& document,
                       std::int64_t expected_version,
                       const std::vector<Patch>& batches,
                       std::optional<std::string> actor = std::nullopt,
                       std::vector<std::string> evidence = {}) const
        -> Result<BatchOutcome, PatchError>;

    auto audit_log(const Document& document) const
        -> Result<std::vector<AuditEntry>, std::string>;

    auto verify_audit_chain(const Document& document) const -> AuditChainReport;

private:
    auto check_document(const Document& document) const -> Result<void, PatchError>;
    auto reject(PatchError error) const -> Failure<PatchError>;
    auto now() const -> std::string;

    EngineOptions options_;
    Logger log_;
    ContentHasher hasher_;
    PatchValidator validator_;
    AuditRecorder recorder_;
};

}  // namespace docpatch_cpp
