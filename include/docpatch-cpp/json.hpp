/// @file json.hpp
/// @brief nlohmann/json interoperability for docpatch-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the value tree,
/// operations, documents, results, audit entries, errors and options, plus
/// wire-level parsing of patches and requests that reports every problem.

#pragma once

#include <docpatch-cpp/audit.hpp>
#include <docpatch-cpp/document.hpp>
#include <docpatch-cpp/engine.hpp>
#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/validator.hpp>
#include <docpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace docpatch_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Value tree ---------------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

// -- Operations ---------------------------------------------------------------
//
// from_json throws std::runtime_error on the first problem; use parse_patch()
// to collect all of them.

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

// -- Documents and results ----------------------------------------------------

void to_json(nlohmann::json& j, const Document& d);
void from_json(const nlohmann::json& j, Document& d);

/// Response shape: success, new_version, content_hash, inverse_patch,
/// applied_at and dry_run.
void to_json(nlohmann::json& j, const PatchResult& r);

void to_json(nlohmann::json& j, const PatchRequest& r);

void to_json(nlohmann::json& j, const ValidationResult& r);

void to_json(nlohmann::json& j, const AuditEntry& e);
void from_json(const nlohmann::json& j, AuditEntry& e);

void to_json(nlohmann::json& j, const AuditChainReport& r);

/// {"error": <kind>, "message": <describe()>, ...kind-specific members}.
void to_json(nlohmann::json& j, const PatchError& e);

// -- Configuration ------------------------------------------------------------
//
// Only the serializable members; `clock` and `log_sink` are left alone.

void to_json(nlohmann::json& j, const EngineOptions& o);
void from_json(const nlohmann::json& j, EngineOptions& o);

// =============================================================================
// Wire-level parsing
// =============================================================================

/// Parse a patch array, collecting every structural problem: a non-array
/// patch, non-object elements, missing or ill-typed "op", "path", "from" and
/// "value" members, and unknown op names. Messages are prefixed with
/// "operation <index>: ".
auto parse_patch(const nlohmann::json& j) -> Result<Patch, PatchValidationError>;

/// Parse {document_version, patch, evidence?, dry_run?, actor?}, collecting
/// every problem as parse_patch() does.
auto parse_request(const nlohmann::json& j) -> Result<PatchRequest, PatchValidationError>;

}  // namespace docpatch_cpp
