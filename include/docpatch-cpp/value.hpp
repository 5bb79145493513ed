/// @file value.hpp
/// @brief The document value tree: Value, Array, Object, and Null.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace docpatch_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The closed set of kinds a Value can hold.
enum class ValueType : std::uint8_t {
    null,
    boolean,
    integer,           ///< Signed 64-bit integer.
    unsigned_integer,  ///< Unsigned integer too large for int64.
    floating,          ///< IEEE double.
    string,
    array,
    object,
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:             return "null";
        case ValueType::boolean:          return "boolean";
        case ValueType::integer:          return "integer";
        case ValueType::unsigned_integer: return "unsigned_integer";
        case ValueType::floating:         return "floating";
        case ValueType::string:           return "string";
        case ValueType::array:            return "array";
        case ValueType::object:           return "object";
    }
    return "unknown";
}

class Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A mapping from string keys to values.
///
/// Keys are unique. Members keep their insertion order, and replacing the
/// value of an existing key keeps its position. Equality ignores order.
class Object {
public:
    using Member = std::pair<std::string, Value>;
    using iterator = std::vector<Member>::iterator;
    using const_iterator = std::vector<Member>::const_iterator;

    Object() = default;
    Object(std::initializer_list<Member> members);

    auto size() const -> std::size_t;
    auto empty() const -> bool;
    auto contains(std::string_view key) const -> bool;

    /// Get the value at a key, or nullptr if the key is absent.
    auto find(std::string_view key) -> Value*;
    auto find(std::string_view key) const -> const Value*;

    /// Insert or replace the value at a key.
    /// @return true if the key was newly inserted.
    auto put(std::string key, Value value) -> bool;

    /// Remove a key, returning the value it held.
    auto erase(std::string_view key) -> std::optional<Value>;

    /// All keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    auto begin() -> iterator;
    auto end() -> iterator;
    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    auto operator==(const Object& other) const -> bool;

private:
    std::vector<Member> members_;
};

/// A node in the document tree.
///
/// Integers that fit in int64 are always stored as int64, whatever type
/// they were constructed from; only larger unsigned values use uint64.
/// Equality is structural, and numbers compare by value across the three
/// numeric representations.
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Array,
        Object
    >;

    Value() = default;
    Value(Null) {}
    Value(bool b) : data_{b} {}

    template <std::integral I>
        requires (!std::same_as<I, bool>)
    Value(I i) {
        if constexpr (std::is_signed_v<I>) {
            data_ = static_cast<std::int64_t>(i);
        } else if (static_cast<std::uint64_t>(i) <=
                   static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            data_ = static_cast<std::int64_t>(i);
        } else {
            data_ = static_cast<std::uint64_t>(i);
        }
    }

    Value(double d) : data_{d} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(Array a) : data_{std::move(a)} {}
    Value(Object o) : data_{std::move(o)} {}

    auto type() const -> ValueType;

    auto is_null() const -> bool { return std::holds_alternative<Null>(data_); }
    auto is_bool() const -> bool { return std::holds_alternative<bool>(data_); }
    auto is_number() const -> bool {
        return std::holds_alternative<std::int64_t>(data_) ||
               std::holds_alternative<std::uint64_t>(data_) ||
               std::holds_alternative<double>(data_);
    }
    auto is_string() const -> bool { return std::holds_alternative<std::string>(data_); }
    auto is_array() const -> bool { return std::holds_alternative<Array>(data_); }
    auto is_object() const -> bool { return std::holds_alternative<Object>(data_); }
    auto is_container() const -> bool { return is_array() || is_object(); }

    /// Typed access; throws std::bad_variant_access on a kind mismatch.
    auto as_array() -> Array& { return std::get<Array>(data_); }
    auto as_array() const -> const Array& { return std::get<Array>(data_); }
    auto as_object() -> Object& { return std::get<Object>(data_); }
    auto as_object() const -> const Object& { return std::get<Object>(data_); }
    auto as_string() const -> const std::string& { return std::get<std::string>(data_); }

    /// Pointer to the held alternative, or nullptr on a kind mismatch.
    template <typename T>
    auto get_if() -> T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() const -> const T* { return std::get_if<T>(&data_); }

    auto storage() const -> const Storage& { return data_; }

    auto operator==(const Value& other) const -> bool;

private:
    Storage data_{};
};

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Extract a typed scalar from a Value, or nullopt on a kind mismatch.
/// @code
/// auto name = get_as<std::string>(value);
/// @endcode
template <typename T>
auto get_as(const Value& v) -> std::optional<T> {
    if (const auto* t = v.get_if<T>()) {
        return *t;
    }
    return std::nullopt;
}

/// True unless some number in the tree is NaN or infinite.
auto all_numbers_finite(const Value& value) -> bool;

/// Writes the compact canonical JSON form of the value.
auto operator<<(std::ostream& os, const Value& value) -> std::ostream&;

}  // namespace docpatch_cpp
