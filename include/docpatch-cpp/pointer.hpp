/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) parsing and resolution against a Value tree.

#pragma once

#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch_cpp {

/// Categories of pointer failures.
enum class PointerErrorKind : std::uint8_t {
    invalid_pointer,     ///< The pointer text is malformed.
    path_not_found,      ///< An object member or the target is missing.
    type_mismatch,       ///< A token indexes into a scalar, or a non-index into an array.
    index_out_of_range,  ///< An array index is beyond the permitted range.
};

/// Convert a PointerErrorKind to its string representation.
constexpr auto to_string_view(PointerErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case PointerErrorKind::invalid_pointer:    return "invalid_pointer";
        case PointerErrorKind::path_not_found:     return "path_not_found";
        case PointerErrorKind::type_mismatch:      return "type_mismatch";
        case PointerErrorKind::index_out_of_range: return "index_out_of_range";
    }
    return "unknown";
}

/// Why a pointer could not be parsed or resolved.
struct PointerError {
    PointerErrorKind kind;
    std::string message;
    std::size_t token_index{0};  ///< The token at which resolution stopped.

    auto operator==(const PointerError&) const -> bool = default;
};

/// A parsed JSON Pointer: a sequence of unescaped reference tokens.
///
/// The empty pointer refers to the whole document.
class Pointer {
public:
    Pointer() = default;
    explicit Pointer(std::vector<std::string> tokens) : tokens_{std::move(tokens)} {}

    /// Parse RFC 6901 text ("" or "/a/b~1c/0").
    static auto parse(std::string_view text) -> Result<Pointer, PointerError>;

    auto tokens() const -> const std::vector<std::string>& { return tokens_; }
    auto size() const -> std::size_t { return tokens_.size(); }
    auto is_root() const -> bool { return tokens_.empty(); }

    /// The last token. Precondition: !is_root().
    auto back() const -> const std::string& { return tokens_.back(); }

    /// The pointer to the containing value. The root's parent is the root.
    auto parent() const -> Pointer;

    auto child(std::string token) const -> Pointer;
    auto child(std::size_t index) const -> Pointer;

    /// True if this pointer equals `other` or is an ancestor of it.
    auto is_prefix_of(const Pointer& other) const -> bool;

    /// True if this pointer is a strict ancestor of `other`.
    auto is_proper_prefix_of(const Pointer& other) const -> bool;

    /// Escaped RFC 6901 text.
    auto to_string() const -> std::string;

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> tokens_;
};

/// Escape a reference token: "~" -> "~0", "/" -> "~1".
auto escape_token(std::string_view token) -> std::string;

/// Parse an array index token. Digits only, no leading zeros, no sign.
auto parse_index(std::string_view token) -> std::optional<std::size_t>;

/// How the final token of a pointer is resolved.
enum class ResolveMode : std::uint8_t {
    existing,  ///< The target must exist; "-" is rejected.
    insert,    ///< Add semantics: any object key, array index in [0, size] or "-".
};

/// A resolved position inside a tree: the containing value and the slot.
///
/// `container` is nullptr when the pointer is the root. For arrays, `index`
/// is the concrete position ("-" is already turned into the array size).
struct Location {
    Value* container{nullptr};
    std::string key;
    std::size_t index{0};
    bool exists{false};  ///< A value currently occupies the slot.

    auto is_root() const -> bool { return container == nullptr; }
    auto in_array() const -> bool { return container != nullptr && container->is_array(); }

    /// The value at the slot, or nullptr if the slot is empty.
    auto target() const -> Value*;
};

/// Find the value a pointer refers to.
auto find(const Value& root, const Pointer& pointer) -> Result<const Value*, PointerError>;
auto find(Value& root, const Pointer& pointer) -> Result<Value*, PointerError>;

/// Resolve a pointer to a slot, checking the final token against `mode`.
/// Every token but the last must name an existing container.
auto locate(Value& root, const Pointer& pointer, ResolveMode mode)
    -> Result<Location, PointerError>;

/// The pointer with "-" replaced by the concrete index of `location`.
auto concrete_pointer(const Pointer& pointer, const Location& location) -> Pointer;

}  // namespace docpatch_cpp
