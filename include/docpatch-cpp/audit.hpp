/// @file audit.hpp
/// @brief The audit log and hash chain embedded in document content.

#pragma once

#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/pointer.hpp>
#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docpatch_cpp {

/// One committed patch, as recorded in the document's audit array.
///
/// Stored as:
/// @code
/// {"action": "patch_applied", "actor": "alice", "timestamp": "2026-01-02T03:04:05.678Z",
///  "version": 2, "content_hash": "sha256:...", "previous_hash": "sha256:...",
///  "details": {"patch_operations": 1, "operations": ["replace"], "evidence": []}}
/// @endcode
struct AuditEntry {
    std::string action{"patch_applied"};
    std::optional<std::string> actor;
    std::string timestamp;
    std::int64_t version{0};        ///< The version the patch produced.
    std::string content_hash;       ///< Hash of the content at `version`.
    std::string previous_hash;      ///< Hash of the content at `version - 1`.
    std::size_t patch_operations{0};
    std::vector<std::string> operations;  ///< Op names in patch order.
    std::vector<std::string> evidence;

    auto operator==(const AuditEntry&) const -> bool = default;
};

auto to_value(const AuditEntry& entry) -> Value;

/// Decode an entry. Fails with a message naming the first bad member.
auto audit_entry_from_value(const Value& value) -> Result<AuditEntry, std::string>;

/// Writes commits into document content: the audit entry into the audit
/// array and, optionally, the hash pair into the versioning metadata object
/// and the entry's timestamp at the updated_at pointer. Missing containers
/// along any of these pointers are created as objects.
class AuditRecorder {
public:
    /// Throws std::invalid_argument if the options are invalid.
    explicit AuditRecorder(const EngineOptions& options);

    /// Build the entry describing `patch`.
    auto make_entry(const Patch& patch,
                    std::optional<std::string> actor,
                    std::vector<std::string> evidence,
                    std::string timestamp,
                    std::int64_t version,
                    std::string content_hash,
                    std::string previous_hash) const -> AuditEntry;

    /// Create the objects enclosing the audit array, the versioning
    /// metadata and the updated_at timestamp. Run before hashing so dry runs
    /// and commits hash alike.
    auto prepare(Value& content) const -> Result<void, std::string>;

    /// Append `entry` and, if enabled, mirror its hash pair and timestamp.
    auto record(Value& content, const AuditEntry& entry) const -> Result<void, std::string>;

    auto audit_pointer() const -> const Pointer& { return audit_; }
    auto versioning_pointer() const -> const Pointer& { return versioning_; }
    auto updated_at_pointer() const -> const Pointer& { return updated_at_; }

private:
    Pointer audit_;
    Pointer versioning_;
    Pointer updated_at_;
    bool record_versioning_;
};

/// Decode every entry of a document's audit array. A document without one
/// has an empty log.
auto read_audit_log(const Document& document, const EngineOptions& options)
    -> Result<std::vector<AuditEntry>, std::string>;

/// Outcome of verify_audit_chain().
struct AuditChainReport {
    bool ok{true};
    std::size_t checked{0};                   ///< Entries examined.
    std::optional<std::size_t> failed_index;  ///< First bad entry, if any.
    std::string reason;
};

/// Check that the audit log forms an unbroken chain ending at the document:
/// versions are consecutive, each previous_hash is the prior content_hash,
/// and the last entry matches the document's version and hash. When present,
/// the versioning metadata must also carry the document's hash and the
/// updated_at timestamp the last entry's timestamp.
auto verify_audit_chain(const Document& document, const EngineOptions& options)
    -> AuditChainReport;

}  // namespace docpatch_cpp
