/// @file applier.hpp
/// @brief Atomic application of patch operations to a value tree.

#pragma once

#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/value.hpp>

#include <string>

namespace docpatch_cpp {

/// Apply one operation to `root` in place.
///
/// On failure the reason is returned and `root` may be partly modified
/// (a move that removed its source but could not insert it); callers that
/// need atomicity apply to a copy, as apply_patch() does.
auto apply_operation(Value& root, const Operation& op) -> Result<void, std::string>;

/// Apply every operation in order to a working copy of `content`.
///
/// Returns the new tree, or the index and reason of the first failing
/// operation. `content` is never modified.
///
/// @code
/// auto next = apply_patch({ReplaceOp{"/field", 2}}, doc.content);
/// if (!next) std::cerr << next.error().reason;
/// @endcode
auto apply_patch(const Patch& patch, const Value& content)
    -> Result<Value, PatchApplicationError>;

}  // namespace docpatch_cpp
