#include <docpatch-cpp/validator.hpp>

#include <stdexcept>

namespace docpatch_cpp {

namespace {

auto prefix(std::size_t index) -> std::string {
    return "operation " + std::to_string(index) + ": ";
}

auto parse_checked(std::size_t index, const char* member, const std::string& text,
                   std::vector<std::string>& errors) -> std::optional<Pointer> {
    auto pointer = Pointer::parse(text);
    if (!pointer) {
        errors.push_back(prefix(index) + member + " '" + text +
                         "' is not a valid JSON pointer: " + pointer.error().message);
        return std::nullopt;
    }
    return *std::move(pointer);
}

auto overlaps(const Pointer& a, const Pointer& b) -> bool {
    return a.is_prefix_of(b) || b.is_prefix_of(a);
}

// Walks `region` through `root`. Existing ancestors must be objects; a
// missing ancestor ends the walk since the engine creates it on commit.
// Returns the value at the region itself, or nullptr if it is absent.
auto walk_region(const Value& root, const Pointer& region, const std::string& name,
                 std::vector<std::string>& errors) -> const Value* {
    const Value* current = &root;
    auto walked = Pointer{};
    for (const auto& token : region.tokens()) {
        if (!current->is_object()) {
            errors.push_back(name + ": '" + walked.to_string() + "' is a " +
                             std::string{to_string_view(current->type())} +
                             ", expected an object");
            return nullptr;
        }
        current = current->as_object().find(token);
        if (!current) return nullptr;
        walked = walked.child(token);
    }
    return current;
}

auto parse_region(const std::string& text, const char* name) -> Pointer {
    auto pointer = Pointer::parse(text);
    if (!pointer) {
        throw std::invalid_argument{std::string{name} + ": " + pointer.error().message};
    }
    return *std::move(pointer);
}

}  // anonymous namespace

PatchValidator::PatchValidator(const EngineOptions& options)
    : max_operations_{options.max_operations},
      audit_{parse_region(options.audit_pointer, "audit_pointer")},
      versioning_{parse_region(options.versioning_pointer, "versioning_pointer")},
      updated_at_{parse_region(options.updated_at_pointer, "updated_at_pointer")},
      record_versioning_{options.record_versioning_metadata} {
    validate_options(options);
}

auto PatchValidator::validate(const Patch& patch) const -> ValidationResult {
    auto errors = std::vector<std::string>{};
    if (patch.size() > max_operations_) {
        errors.push_back("patch has " + std::to_string(patch.size()) +
                         " operations, the limit is " + std::to_string(max_operations_));
    }
    for (std::size_t i = 0; i < patch.size(); ++i) {
        check_operation(i, patch[i], errors);
    }
    return ValidationResult{errors.empty(), std::move(errors)};
}

auto PatchValidator::validate(const Patch& patch, const Document& document) const
    -> ValidationResult {
    auto result = validate(patch);
    check_document(document, result.errors);
    result.is_valid = result.errors.empty();
    return result;
}

void PatchValidator::check_operation(std::size_t index, const Operation& op,
                                     std::vector<std::string>& errors) const {
    const auto kind = kind_of(op);
    auto path = parse_checked(index, "path", target_path(op), errors);

    auto from = std::optional<Pointer>{};
    if (const auto* source = source_path(op)) {
        from = parse_checked(index, "from", *source, errors);
    }

    if (path && !path->is_root() && path->back() == "-" &&
        (kind == OpKind::remove || kind == OpKind::replace || kind == OpKind::test)) {
        errors.push_back(prefix(index) + "'-' is only valid as the target of add, move or copy");
    }
    if (from && !from->is_root() && from->back() == "-") {
        errors.push_back(prefix(index) + "'-' cannot be used as a source");
    }

    const auto* value = std::visit(overload{
        [](const AddOp& o) { return &o.value; },
        [](const ReplaceOp& o) { return &o.value; },
        [](const TestOp& o) { return &o.value; },
        [](const auto&) -> const Value* { return nullptr; },
    }, op);
    if (value && !all_numbers_finite(*value)) {
        errors.push_back(prefix(index) + "value contains a non-finite number");
    }

    if (path && kind == OpKind::remove && path->is_root()) {
        errors.push_back(prefix(index) + "cannot remove the whole document");
    }
    if (path && from && kind == OpKind::move && from->is_proper_prefix_of(*path)) {
        errors.push_back(prefix(index) + "cannot move '" + from->to_string() +
                         "' into its own child '" + path->to_string() + "'");
    }

    if (!is_mutating(kind)) return;

    auto check_protected = [&](const Pointer& written) {
        if (overlaps(written, audit_)) {
            errors.push_back(prefix(index) + "'" + written.to_string() +
                             "' overlaps the audit log at '" + audit_.to_string() + "'");
        }
        if (overlaps(written, versioning_)) {
            errors.push_back(prefix(index) + "'" + written.to_string() +
                             "' overlaps the versioning metadata at '" +
                             versioning_.to_string() + "'");
        }
        if (overlaps(written, updated_at_)) {
            errors.push_back(prefix(index) + "'" + written.to_string() +
                             "' overlaps the updated_at timestamp at '" +
                             updated_at_.to_string() + "'");
        }
    };
    if (path) check_protected(*path);
    // A move also removes its source.
    if (from && kind == OpKind::move) check_protected(*from);
}

void PatchValidator::check_document(const Document& document,
                                    std::vector<std::string>& errors) const {
    if (!document.content.is_object()) {
        errors.push_back("document content must be an object, got " +
                         std::string{to_string_view(document.content.type())});
        return;
    }

    const auto* audit = walk_region(document.content, audit_, "audit log", errors);
    if (audit && !audit->is_array()) {
        errors.push_back("audit log at '" + audit_.to_string() + "' is a " +
                         std::string{to_string_view(audit->type())} + ", expected an array");
    }

    if (!record_versioning_) return;
    const auto* meta = walk_region(document.content, versioning_, "versioning metadata", errors);
    if (meta && !meta->is_object()) {
        errors.push_back("versioning metadata at '" + versioning_.to_string() + "' is a " +
                         std::string{to_string_view(meta->type())} + ", expected an object");
    }
    // Only the ancestors matter, record() overwrites the timestamp itself.
    walk_region(document.content, updated_at_, "updated_at timestamp", errors);
}

}  // namespace docpatch_cpp
