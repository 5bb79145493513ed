/// @file operation.hpp
/// @brief Patch operation types (RFC 6902 add/remove/replace/move/copy/test).

#pragma once

#include <docpatch-cpp/value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docpatch_cpp {

/// The kind of mutation (or check) an operation represents.
enum class OpKind : std::uint8_t {
    add,      ///< Insert into an array or create/overwrite an object member.
    remove,   ///< Delete an existing value.
    replace,  ///< Overwrite an existing value.
    move,     ///< Remove a value and add it elsewhere.
    copy,     ///< Add a deep copy of a value elsewhere.
    test,     ///< Check a value for equality without mutating.
};

/// Convert an OpKind to its wire name.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::add:     return "add";
        case OpKind::remove:  return "remove";
        case OpKind::replace: return "replace";
        case OpKind::move:    return "move";
        case OpKind::copy:    return "copy";
        case OpKind::test:    return "test";
    }
    return "unknown";
}

/// Parse a wire name ("add", "remove", ...). Unknown names yield nullopt.
auto parse_op_kind(std::string_view name) -> std::optional<OpKind>;

struct AddOp {
    std::string path;
    Value value;
    auto operator==(const AddOp&) const -> bool = default;
};

struct RemoveOp {
    std::string path;
    auto operator==(const RemoveOp&) const -> bool = default;
};

struct ReplaceOp {
    std::string path;
    Value value;
    auto operator==(const ReplaceOp&) const -> bool = default;
};

struct MoveOp {
    std::string from;
    std::string path;
    auto operator==(const MoveOp&) const -> bool = default;
};

struct CopyOp {
    std::string from;
    std::string path;
    auto operator==(const CopyOp&) const -> bool = default;
};

struct TestOp {
    std::string path;
    Value value;
    auto operator==(const TestOp&) const -> bool = default;
};

/// A single patch operation. Paths are JSON Pointer text.
using Operation = std::variant<AddOp, RemoveOp, ReplaceOp, MoveOp, CopyOp, TestOp>;

/// An ordered operation list.
using Patch = std::vector<Operation>;

auto kind_of(const Operation& op) -> OpKind;

/// The `path` member every operation carries.
auto target_path(const Operation& op) -> const std::string&;

/// The `from` member of move/copy, or nullptr for other kinds.
auto source_path(const Operation& op) -> const std::string*;

/// Whether applying an operation of this kind can change the document.
constexpr auto is_mutating(OpKind kind) noexcept -> bool {
    return kind != OpKind::test;
}

/// Wire names of each operation, in patch order.
auto operation_kinds(const Patch& patch) -> std::vector<std::string>;

/// Group operations by the first token of their path ("root" for "").
auto group_by_section(const Patch& patch) -> std::map<std::string, Patch>;

}  // namespace docpatch_cpp
