#include <docpatch-cpp/inverse.hpp>

#include <docpatch-cpp/applier.hpp>
#include <docpatch-cpp/pointer.hpp>

#include <optional>
#include <utility>

namespace docpatch_cpp {

namespace {

// Whether every pointer of `op` resolves in `pre_image` the way the
// operation needs it to.
auto resolves_in(const Value& pre_image, const Operation& op) -> bool {
    auto scratch = pre_image;
    auto check = [&](const std::string& text, ResolveMode mode) {
        auto pointer = Pointer::parse(text);
        return pointer && static_cast<bool>(locate(scratch, *pointer, mode));
    };
    const auto kind = kind_of(op);
    if (const auto* from = source_path(op); from && !check(*from, ResolveMode::existing)) {
        return false;
    }
    const auto mode = (kind == OpKind::add || kind == OpKind::copy || kind == OpKind::move)
                          ? ResolveMode::insert
                          : ResolveMode::existing;
    return check(target_path(op), mode);
}

class InverseBuilder {
public:
    explicit InverseBuilder(const Value& pre_image)
        : pre_image_{pre_image}, working_{pre_image} {}

    auto step(std::size_t index, const Operation& op) -> Result<Patch, PatchError> {
        index_ = index;
        op_ = &op;
        auto path = Pointer::parse(target_path(op));
        if (!path) return failure(path.error().message);

        return std::visit(overload{
            [&](const AddOp& o) { return insert(*path, o.value); },
            [&](const RemoveOp&) { return remove(*path); },
            [&](const ReplaceOp& o) { return replace(*path, o.value); },
            [&](const MoveOp& o) { return move(o.from, *path); },
            [&](const CopyOp& o) { return copy(o.from, *path); },
            [&](const TestOp&) -> Result<Patch, PatchError> { return Patch{}; },
        }, op);
    }

private:
    auto failure(std::string reason) const -> Failure<PatchError> {
        if (resolves_in(pre_image_, *op_)) {
            return fail(PatchError{PatchApplicationError{index_, std::move(reason)}});
        }
        return fail(PatchError{InverseGenerationError{index_, std::move(reason)}});
    }

    auto failure(const Pointer& pointer, const PointerError& error) const -> Failure<PatchError> {
        return failure("path '" + pointer.to_string() + "': " + error.message);
    }

    auto advance(const Operation& op) -> Result<void, PatchError> {
        if (auto applied = apply_operation(working_, op); !applied) {
            return failure(std::move(applied).error());
        }
        return {};
    }

    // Shared by add and copy.
    auto insert(const Pointer& path, const Value& value) -> Result<Patch, PatchError> {
        auto location = locate(working_, path, ResolveMode::insert);
        if (!location) return failure(path, location.error());

        auto inverse = Patch{};
        if (location->is_root()) {
            inverse.push_back(ReplaceOp{"", working_});
        } else if (location->in_array()) {
            inverse.push_back(RemoveOp{concrete_pointer(path, *location).to_string()});
        } else if (location->exists) {
            inverse.push_back(ReplaceOp{path.to_string(), *location->target()});
        } else {
            inverse.push_back(RemoveOp{path.to_string()});
        }

        if (auto r = advance(AddOp{path.to_string(), value}); !r) return fail(std::move(r).error());
        return inverse;
    }

    auto remove(const Pointer& path) -> Result<Patch, PatchError> {
        auto target = find(std::as_const(working_), path);
        if (!target) return failure(path, target.error());
        auto inverse = Patch{AddOp{path.to_string(), **target}};

        if (auto r = advance(*op_); !r) return fail(std::move(r).error());
        return inverse;
    }

    auto replace(const Pointer& path, const Value& value) -> Result<Patch, PatchError> {
        auto target = find(std::as_const(working_), path);
        if (!target) return failure(path, target.error());
        auto inverse = Patch{ReplaceOp{path.to_string(), **target}};

        if (auto r = advance(ReplaceOp{path.to_string(), value}); !r) {
            return fail(std::move(r).error());
        }
        return inverse;
    }

    auto copy(const std::string& from_text, const Pointer& path) -> Result<Patch, PatchError> {
        auto from = Pointer::parse(from_text);
        if (!from) return failure(from.error().message);
        auto source = find(std::as_const(working_), *from);
        if (!source) return failure(*from, source.error());
        auto value = **source;
        return insert(path, value);
    }

    // A move is a remove followed by an add. The inverse is taken between
    // the two, where the destination slot and any value it displaces are
    // known exactly.
    auto move(const std::string& from_text, const Pointer& path) -> Result<Patch, PatchError> {
        auto from = Pointer::parse(from_text);
        if (!from) return failure(from.error().message);
        auto source = find(std::as_const(working_), *from);
        if (!source) return failure(*from, source.error());
        if (*from == path) return Patch{};
        if (from->is_proper_prefix_of(path)) {
            return failure("cannot move '" + from->to_string() + "' into its own child");
        }
        auto value = **source;

        if (auto r = advance(RemoveOp{from->to_string()}); !r) return fail(std::move(r).error());

        auto location = locate(working_, path, ResolveMode::insert);
        if (!location) return failure(path, location.error());
        const auto dest = concrete_pointer(path, *location);
        auto displaced = std::optional<Value>{};
        if (location->is_root()) {
            displaced = working_;
        } else if (location->exists && !location->in_array()) {
            displaced = *location->target();
        }

        auto inverse = Patch{};
        if (displaced) {
            inverse.push_back(ReplaceOp{dest.to_string(), *std::move(displaced)});
            inverse.push_back(AddOp{from->to_string(), value});
        } else if (dest.is_proper_prefix_of(*from)) {
            inverse.push_back(RemoveOp{dest.to_string()});
            inverse.push_back(AddOp{from->to_string(), value});
        } else {
            inverse.push_back(MoveOp{dest.to_string(), from->to_string()});
        }

        if (auto r = advance(AddOp{path.to_string(), std::move(value)}); !r) {
            return fail(std::move(r).error());
        }
        return inverse;
    }

    const Value& pre_image_;
    Value working_;
    std::size_t index_{0};
    const Operation* op_{nullptr};
};

}  // anonymous namespace

auto compute_inverse(const Patch& patch, const Value& pre_image) -> Result<Patch, PatchError> {
    auto builder = InverseBuilder{pre_image};
    auto groups = std::vector<Patch>{};
    groups.reserve(patch.size());
    for (std::size_t i = 0; i < patch.size(); ++i) {
        auto group = builder.step(i, patch[i]);
        if (!group) return fail(std::move(group).error());
        groups.push_back(*std::move(group));
    }

    auto inverse = Patch{};
    for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
        for (auto& op : *it) inverse.push_back(std::move(op));
    }
    return inverse;
}

}  // namespace docpatch_cpp
