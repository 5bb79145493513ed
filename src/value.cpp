#include <docpatch-cpp/value.hpp>
#include <docpatch-cpp/hasher.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>

namespace docpatch_cpp {

// -- Object -------------------------------------------------------------------

Object::Object(std::initializer_list<Member> members) {
    members_.reserve(members.size());
    for (const auto& [key, value] : members) {
        put(key, value);
    }
}

auto Object::size() const -> std::size_t { return members_.size(); }

auto Object::empty() const -> bool { return members_.empty(); }

auto Object::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Object::find(std::string_view key) -> Value* {
    auto it = std::ranges::find_if(members_, [&](const Member& m) { return m.first == key; });
    return it == members_.end() ? nullptr : &it->second;
}

auto Object::find(std::string_view key) const -> const Value* {
    auto it = std::ranges::find_if(members_, [&](const Member& m) { return m.first == key; });
    return it == members_.end() ? nullptr : &it->second;
}

auto Object::put(std::string key, Value value) -> bool {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return false;
    }
    members_.emplace_back(std::move(key), std::move(value));
    return true;
}

auto Object::erase(std::string_view key) -> std::optional<Value> {
    auto it = std::ranges::find_if(members_, [&](const Member& m) { return m.first == key; });
    if (it == members_.end()) return std::nullopt;
    auto removed = std::move(it->second);
    members_.erase(it);
    return removed;
}

auto Object::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(members_.size());
    for (const auto& [key, _] : members_) {
        result.push_back(key);
    }
    return result;
}

auto Object::begin() -> iterator { return members_.begin(); }
auto Object::end() -> iterator { return members_.end(); }
auto Object::begin() const -> const_iterator { return members_.begin(); }
auto Object::end() const -> const_iterator { return members_.end(); }

auto Object::operator==(const Object& other) const -> bool {
    if (members_.size() != other.members_.size()) return false;
    return std::ranges::all_of(members_, [&](const Member& m) {
        const auto* theirs = other.find(m.first);
        return theirs != nullptr && *theirs == m.second;
    });
}

// -- Value --------------------------------------------------------------------

auto Value::type() const -> ValueType {
    return std::visit(overload{
        [](Null) { return ValueType::null; },
        [](bool) { return ValueType::boolean; },
        [](std::int64_t) { return ValueType::integer; },
        [](std::uint64_t) { return ValueType::unsigned_integer; },
        [](double) { return ValueType::floating; },
        [](const std::string&) { return ValueType::string; },
        [](const Array&) { return ValueType::array; },
        [](const Object&) { return ValueType::object; },
    }, data_);
}

namespace {

// Exact: the double must be integral and in range, and the comparison is
// made between integers so no precision is lost.
auto integer_equals(std::int64_t i, double d) -> bool {
    if (d != std::trunc(d)) return false;
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return false;
    return static_cast<std::int64_t>(d) == i;
}

auto integer_equals(std::uint64_t u, double d) -> bool {
    if (d != std::trunc(d)) return false;
    if (d < 0.0 || d >= 18446744073709551616.0) return false;
    return static_cast<std::uint64_t>(d) == u;
}

// Numbers compare by value: int64, uint64 and double are one kind here.
auto numbers_equal(const Value::Storage& a, const Value::Storage& b) -> bool {
    const auto* ai = std::get_if<std::int64_t>(&a);
    const auto* au = std::get_if<std::uint64_t>(&a);
    const auto* ad = std::get_if<double>(&a);
    const auto* bi = std::get_if<std::int64_t>(&b);
    const auto* bu = std::get_if<std::uint64_t>(&b);
    const auto* bd = std::get_if<double>(&b);

    if (ai && bi) return *ai == *bi;
    if (au && bu) return *au == *bu;
    // A normalized uint64 is always above INT64_MAX, so it never equals an int64.
    if ((ai && bu) || (au && bi)) return false;
    if (ad && bd) return *ad == *bd;
    if (ad) return bi ? integer_equals(*bi, *ad) : integer_equals(*bu, *ad);
    return ai ? integer_equals(*ai, *bd) : integer_equals(*au, *bd);
}

}  // anonymous namespace

auto Value::operator==(const Value& other) const -> bool {
    if (is_number() && other.is_number()) {
        return numbers_equal(data_, other.data_);
    }
    if (data_.index() != other.data_.index()) return false;
    return std::visit(overload{
        [](Null) { return true; },
        [&](bool b) { return b == std::get<bool>(other.data_); },
        [&](const std::string& s) { return s == std::get<std::string>(other.data_); },
        [&](const Array& a) { return a == std::get<Array>(other.data_); },
        [&](const Object& o) { return o == std::get<Object>(other.data_); },
        [](auto) { return false; },
    }, data_);
}

auto all_numbers_finite(const Value& value) -> bool {
    return std::visit(overload{
        [](double d) { return std::isfinite(d); },
        [](const Array& a) { return std::ranges::all_of(a, all_numbers_finite); },
        [](const Object& o) {
            return std::ranges::all_of(o, [](const Object::Member& m) {
                return all_numbers_finite(m.second);
            });
        },
        [](const auto&) { return true; },
    }, value.storage());
}

auto operator<<(std::ostream& os, const Value& value) -> std::ostream& {
    return os << canonical_json(value);
}

}  // namespace docpatch_cpp
