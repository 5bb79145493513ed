/// @file result.hpp
/// @brief A value-or-error return type for fallible operations.

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace docpatch_cpp {

/// Wraps an error so it can be returned from a function yielding a Result.
///
/// @code
/// auto check(int v) -> Result<int, std::string> {
///     if (v < 0) return fail(std::string{"negative"});
///     return v;
/// }
/// @endcode
template <typename E>
struct Failure {
    E error;
};

/// Build a Failure from an error value.
template <typename E>
auto fail(E error) -> Failure<E> {
    return Failure<E>{std::move(error)};
}

/// Either a value of type T or an error of type E.
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : data_{std::in_place_index<0>, std::move(value)} {}

    template <typename G>
        requires std::is_constructible_v<E, G>
    Result(Failure<G> failure)
        : data_{std::in_place_index<1>, E(std::move(failure.error))} {}

    auto has_value() const -> bool { return data_.index() == 0; }
    explicit operator bool() const { return has_value(); }

    auto value() & -> T& { return std::get<0>(data_); }
    auto value() const& -> const T& { return std::get<0>(data_); }
    auto value() && -> T&& { return std::get<0>(std::move(data_)); }

    auto error() & -> E& { return std::get<1>(data_); }
    auto error() const& -> const E& { return std::get<1>(data_); }
    auto error() && -> E&& { return std::get<1>(std::move(data_)); }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator*() && -> T&& { return std::move(*this).value(); }

    auto operator->() -> T* { return &value(); }
    auto operator->() const -> const T* { return &value(); }

private:
    std::variant<T, E> data_;
};

/// Success-or-error for operations that produce nothing.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;

    template <typename G>
        requires std::is_constructible_v<E, G>
    Result(Failure<G> failure) : error_{E(std::move(failure.error))} {}

    auto has_value() const -> bool { return !error_.has_value(); }
    explicit operator bool() const { return has_value(); }

    auto error() & -> E& { return *error_; }
    auto error() const& -> const E& { return *error_; }
    auto error() && -> E&& { return std::move(*error_); }

private:
    std::optional<E> error_;
};

}  // namespace docpatch_cpp
