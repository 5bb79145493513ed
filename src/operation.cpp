#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/pointer.hpp>

namespace docpatch_cpp {

auto parse_op_kind(std::string_view name) -> std::optional<OpKind> {
    if (name == "add") return OpKind::add;
    if (name == "remove") return OpKind::remove;
    if (name == "replace") return OpKind::replace;
    if (name == "move") return OpKind::move;
    if (name == "copy") return OpKind::copy;
    if (name == "test") return OpKind::test;
    return std::nullopt;
}

auto kind_of(const Operation& op) -> OpKind {
    return std::visit(overload{
        [](const AddOp&) { return OpKind::add; },
        [](const RemoveOp&) { return OpKind::remove; },
        [](const ReplaceOp&) { return OpKind::replace; },
        [](const MoveOp&) { return OpKind::move; },
        [](const CopyOp&) { return OpKind::copy; },
        [](const TestOp&) { return OpKind::test; },
    }, op);
}

auto target_path(const Operation& op) -> const std::string& {
    return std::visit([](const auto& o) -> const std::string& { return o.path; }, op);
}

auto source_path(const Operation& op) -> const std::string* {
    if (const auto* m = std::get_if<MoveOp>(&op)) return &m->from;
    if (const auto* c = std::get_if<CopyOp>(&op)) return &c->from;
    return nullptr;
}

auto operation_kinds(const Patch& patch) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(patch.size());
    for (const auto& op : patch) {
        result.emplace_back(to_string_view(kind_of(op)));
    }
    return result;
}

auto group_by_section(const Patch& patch) -> std::map<std::string, Patch> {
    auto grouped = std::map<std::string, Patch>{};
    for (const auto& op : patch) {
        const auto& path = target_path(op);
        auto section = std::string{"root"};
        if (auto pointer = Pointer::parse(path); pointer && !pointer->is_root()) {
            section = pointer->tokens().front();
        } else if (!pointer && !path.empty()) {
            // Malformed pointers are grouped by their raw leading segment.
            auto trimmed = std::string_view{path};
            while (!trimmed.empty() && trimmed.front() == '/') trimmed.remove_prefix(1);
            section = std::string{trimmed.substr(0, trimmed.find('/'))};
        }
        grouped[section].push_back(op);
    }
    return grouped;
}

}  // namespace docpatch_cpp
