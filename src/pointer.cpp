#include <docpatch-cpp/pointer.hpp>

#include <algorithm>
#include <charconv>
#include <utility>

namespace docpatch_cpp {

namespace {

auto pointer_error(PointerErrorKind kind, std::string message, std::size_t token_index)
    -> Failure<PointerError> {
    return fail(PointerError{kind, std::move(message), token_index});
}

// Index syntax regardless of magnitude: digits only, no leading zeros.
auto is_index_syntax(std::string_view token) -> bool {
    if (token.empty() || (token.size() > 1 && token[0] == '0')) return false;
    return std::ranges::all_of(token, [](char c) { return c >= '0' && c <= '9'; });
}

auto out_of_range(const std::string& token, std::size_t size, std::size_t token_index)
    -> Failure<PointerError> {
    return pointer_error(PointerErrorKind::index_out_of_range,
                         "index " + token + " is out of range for array of size " +
                             std::to_string(size), token_index);
}

// A final token that is not a usable index. Well-formed indices too large
// for size_t are out of range, anything else is a type mismatch.
auto bad_index(const std::string& token, std::size_t size, std::size_t token_index)
    -> Failure<PointerError> {
    if (is_index_syntax(token)) return out_of_range(token, size, token_index);
    return pointer_error(PointerErrorKind::type_mismatch,
                         "'" + token + "' is not an array index", token_index);
}

// Walks every token but the last. Shared by the const and mutable lookups.
// An array element missing along the way is path_not_found, like a missing
// member.
template <typename V>
auto walk_to_parent(V& root, const Pointer& pointer) -> Result<V*, PointerError> {
    V* current = &root;
    const auto& tokens = pointer.tokens();
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (current->is_object()) {
            auto* child = current->as_object().find(token);
            if (!child) {
                return pointer_error(PointerErrorKind::path_not_found,
                                     "member '" + token + "' does not exist", i);
            }
            current = child;
        } else if (current->is_array()) {
            auto& arr = current->as_array();
            if (!is_index_syntax(token)) {
                return pointer_error(PointerErrorKind::type_mismatch,
                                     "'" + token + "' is not an array index", i);
            }
            auto idx = parse_index(token);
            if (!idx || *idx >= arr.size()) {
                return pointer_error(PointerErrorKind::path_not_found,
                                     "element " + token + " does not exist in array of size " +
                                         std::to_string(arr.size()), i);
            }
            current = &arr[*idx];
        } else {
            return pointer_error(PointerErrorKind::type_mismatch,
                                 "cannot index into a " +
                                     std::string{to_string_view(current->type())} +
                                     " with '" + token + "'", i);
        }
    }
    return current;
}

template <typename V>
auto find_impl(V& root, const Pointer& pointer) -> Result<V*, PointerError> {
    if (pointer.is_root()) return &root;

    auto parent = walk_to_parent(root, pointer);
    if (!parent) return fail(std::move(parent).error());

    V* container = *parent;
    const auto& token = pointer.back();
    const auto last = pointer.size() - 1;
    if (container->is_object()) {
        auto* child = container->as_object().find(token);
        if (!child) {
            return pointer_error(PointerErrorKind::path_not_found,
                                 "member '" + token + "' does not exist", last);
        }
        return child;
    }
    if (container->is_array()) {
        auto& arr = container->as_array();
        auto idx = parse_index(token);
        if (!idx) return bad_index(token, arr.size(), last);
        if (*idx >= arr.size()) return out_of_range(token, arr.size(), last);
        return &arr[*idx];
    }
    return pointer_error(PointerErrorKind::type_mismatch,
                         "cannot index into a " + std::string{to_string_view(container->type())} +
                             " with '" + token + "'", last);
}

}  // anonymous namespace

// -- Pointer ------------------------------------------------------------------

auto Pointer::parse(std::string_view text) -> Result<Pointer, PointerError> {
    if (text.empty()) return Pointer{};
    if (text[0] != '/') {
        return pointer_error(PointerErrorKind::invalid_pointer,
                             "pointer must be empty or start with '/'", 0);
    }

    auto tokens = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = text.find('/', pos);
        auto raw = text.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                   : next - pos);
        auto token = std::string{};
        token.reserve(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] != '~') {
                token.push_back(raw[i]);
                continue;
            }
            if (i + 1 < raw.size() && raw[i + 1] == '0') {
                token.push_back('~');
            } else if (i + 1 < raw.size() && raw[i + 1] == '1') {
                token.push_back('/');
            } else {
                return pointer_error(PointerErrorKind::invalid_pointer,
                                     "'~' must be followed by '0' or '1'", tokens.size());
            }
            ++i;
        }
        tokens.push_back(std::move(token));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return Pointer{std::move(tokens)};
}

auto Pointer::parent() const -> Pointer {
    if (tokens_.empty()) return *this;
    return Pointer{std::vector<std::string>(tokens_.begin(), tokens_.end() - 1)};
}

auto Pointer::child(std::string token) const -> Pointer {
    auto tokens = tokens_;
    tokens.push_back(std::move(token));
    return Pointer{std::move(tokens)};
}

auto Pointer::child(std::size_t index) const -> Pointer {
    return child(std::to_string(index));
}

auto Pointer::is_prefix_of(const Pointer& other) const -> bool {
    if (tokens_.size() > other.tokens_.size()) return false;
    return std::equal(tokens_.begin(), tokens_.end(), other.tokens_.begin());
}

auto Pointer::is_proper_prefix_of(const Pointer& other) const -> bool {
    return tokens_.size() < other.tokens_.size() && is_prefix_of(other);
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result.push_back('/');
        result += escape_token(token);
    }
    return result;
}

auto escape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto parse_index(std::string_view token) -> std::optional<std::size_t> {
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (!is_index_syntax(token)) return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

// -- Resolution ---------------------------------------------------------------

auto Location::target() const -> Value* {
    if (!exists || container == nullptr) return nullptr;
    if (container->is_array()) return &container->as_array()[index];
    return container->as_object().find(key);
}

auto find(const Value& root, const Pointer& pointer) -> Result<const Value*, PointerError> {
    return find_impl(root, pointer);
}

auto find(Value& root, const Pointer& pointer) -> Result<Value*, PointerError> {
    return find_impl(root, pointer);
}

auto locate(Value& root, const Pointer& pointer, ResolveMode mode)
    -> Result<Location, PointerError> {
    if (pointer.is_root()) {
        return Location{.container = nullptr, .key = {}, .index = 0, .exists = true};
    }

    auto parent = walk_to_parent(root, pointer);
    if (!parent) return fail(std::move(parent).error());

    Value* container = *parent;
    const auto& token = pointer.back();
    const auto last = pointer.size() - 1;

    if (container->is_object()) {
        auto exists = container->as_object().contains(token);
        if (mode == ResolveMode::existing && !exists) {
            return pointer_error(PointerErrorKind::path_not_found,
                                 "member '" + token + "' does not exist", last);
        }
        return Location{.container = container, .key = token, .index = 0, .exists = exists};
    }

    if (container->is_array()) {
        const auto size = container->as_array().size();
        if (token == "-") {
            if (mode == ResolveMode::existing) {
                return pointer_error(PointerErrorKind::index_out_of_range,
                                     "'-' refers to a nonexistent element", last);
            }
            return Location{.container = container, .key = {}, .index = size, .exists = false};
        }
        auto idx = parse_index(token);
        if (!idx) return bad_index(token, size, last);
        const auto limit = (mode == ResolveMode::insert) ? size : size - 1;
        if (size == 0 && mode == ResolveMode::existing) {
            return pointer_error(PointerErrorKind::index_out_of_range,
                                 "index " + token + " is out of range for an empty array", last);
        }
        if (*idx > limit) return out_of_range(token, size, last);
        return Location{.container = container, .key = {}, .index = *idx,
                        .exists = mode == ResolveMode::existing};
    }

    return pointer_error(PointerErrorKind::type_mismatch,
                         "cannot index into a " + std::string{to_string_view(container->type())} +
                             " with '" + token + "'", last);
}

auto concrete_pointer(const Pointer& pointer, const Location& location) -> Pointer {
    if (location.in_array()) {
        return pointer.parent().child(location.index);
    }
    return pointer;
}

}  // namespace docpatch_cpp
