#include <docpatch-cpp/applier.hpp>
#include <docpatch-cpp/pointer.hpp>

#include <iterator>
#include <utility>

namespace docpatch_cpp {

namespace {

auto parse(const std::string& text) -> Result<Pointer, std::string> {
    auto pointer = Pointer::parse(text);
    if (!pointer) return fail("'" + text + "' is not a valid JSON pointer: " + pointer.error().message);
    return *std::move(pointer);
}

auto pointer_failure(const Pointer& pointer, const PointerError& error) -> Failure<std::string> {
    return fail("path '" + pointer.to_string() + "': " + error.message);
}

// Add semantics: insert into an array, create or overwrite an object member,
// or replace the whole tree.
auto insert_at(Value& root, const Pointer& path, Value value) -> Result<void, std::string> {
    auto location = locate(root, path, ResolveMode::insert);
    if (!location) return pointer_failure(path, location.error());

    if (location->is_root()) {
        root = std::move(value);
    } else if (location->in_array()) {
        auto& arr = location->container->as_array();
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(location->index), std::move(value));
    } else {
        location->container->as_object().put(location->key, std::move(value));
    }
    return {};
}

auto remove_at(Value& root, const Pointer& path) -> Result<Value, std::string> {
    if (path.is_root()) return fail(std::string{"cannot remove the whole document"});
    auto location = locate(root, path, ResolveMode::existing);
    if (!location) return pointer_failure(path, location.error());

    if (location->in_array()) {
        auto& arr = location->container->as_array();
        auto it = arr.begin() + static_cast<std::ptrdiff_t>(location->index);
        auto removed = std::move(*it);
        arr.erase(it);
        return removed;
    }
    return *location->container->as_object().erase(location->key);
}

}  // anonymous namespace

auto apply_operation(Value& root, const Operation& op) -> Result<void, std::string> {
    auto path = parse(target_path(op));
    if (!path) return fail(std::move(path).error());

    return std::visit(overload{
        [&](const AddOp& o) -> Result<void, std::string> {
            return insert_at(root, *path, o.value);
        },
        [&](const RemoveOp&) -> Result<void, std::string> {
            auto removed = remove_at(root, *path);
            if (!removed) return fail(std::move(removed).error());
            return {};
        },
        [&](const ReplaceOp& o) -> Result<void, std::string> {
            auto target = find(root, *path);
            if (!target) return pointer_failure(*path, target.error());
            **target = o.value;
            return {};
        },
        [&](const MoveOp& o) -> Result<void, std::string> {
            auto from = parse(o.from);
            if (!from) return fail(std::move(from).error());
            if (auto source = find(root, *from); !source) {
                return pointer_failure(*from, source.error());
            }
            if (*from == *path) return {};
            if (from->is_proper_prefix_of(*path)) {
                return fail("cannot move '" + from->to_string() + "' into its own child");
            }
            auto value = remove_at(root, *from);
            if (!value) return fail(std::move(value).error());
            return insert_at(root, *path, *std::move(value));
        },
        [&](const CopyOp& o) -> Result<void, std::string> {
            auto from = parse(o.from);
            if (!from) return fail(std::move(from).error());
            auto source = find(root, *from);
            if (!source) return pointer_failure(*from, source.error());
            auto value = **source;
            return insert_at(root, *path, std::move(value));
        },
        [&](const TestOp& o) -> Result<void, std::string> {
            auto target = find(std::as_const(root), *path);
            if (!target) return pointer_failure(*path, target.error());
            if (!(**target == o.value)) {
                return fail("test failed: value at '" + path->to_string() +
                            "' is not equal to the expected value");
            }
            return {};
        },
    }, op);
}

auto apply_patch(const Patch& patch, const Value& content)
    -> Result<Value, PatchApplicationError> {
    auto working = content;
    for (std::size_t i = 0; i < patch.size(); ++i) {
        if (auto applied = apply_operation(working, patch[i]); !applied) {
            return fail(PatchApplicationError{i, std::move(applied).error()});
        }
    }
    return working;
}

}  // namespace docpatch_cpp
