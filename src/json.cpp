#include <docpatch-cpp/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docpatch_cpp {

namespace {

auto join(const std::vector<std::string>& messages) -> std::string {
    auto text = std::string{};
    for (const auto& m : messages) {
        if (!text.empty()) text += "; ";
        text += m;
    }
    return text;
}

auto op_prefix(std::size_t index) -> std::string {
    return "operation " + std::to_string(index) + ": ";
}

auto string_member(const nlohmann::json& j, const char* key, const std::string& prefix,
                   std::vector<std::string>& errors) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end()) {
        errors.push_back(prefix + "missing '" + key + "'");
        return std::nullopt;
    }
    if (!it->is_string()) {
        errors.push_back(prefix + "'" + key + "' must be a string");
        return std::nullopt;
    }
    return it->get<std::string>();
}

auto value_member(const nlohmann::json& j, const std::string& prefix,
                  std::vector<std::string>& errors) -> std::optional<Value> {
    auto it = j.find("value");
    if (it == j.end()) {
        errors.push_back(prefix + "missing 'value'");
        return std::nullopt;
    }
    return it->get<Value>();
}

auto parse_operation(const nlohmann::json& j, const std::string& prefix,
                     std::vector<std::string>& errors) -> std::optional<Operation> {
    if (!j.is_object()) {
        errors.push_back(prefix + "must be an object");
        return std::nullopt;
    }
    const auto before = errors.size();

    auto name = string_member(j, "op", prefix, errors);
    auto kind = std::optional<OpKind>{};
    if (name) {
        kind = parse_op_kind(*name);
        if (!kind) errors.push_back(prefix + "unknown op '" + *name + "'");
    }
    auto path = string_member(j, "path", prefix, errors);
    if (!kind) return std::nullopt;

    auto from = std::optional<std::string>{};
    auto value = std::optional<Value>{};
    switch (*kind) {
        case OpKind::add:
        case OpKind::replace:
        case OpKind::test:
            value = value_member(j, prefix, errors);
            break;
        case OpKind::move:
        case OpKind::copy:
            from = string_member(j, "from", prefix, errors);
            break;
        case OpKind::remove:
            break;
    }
    if (errors.size() != before) return std::nullopt;

    switch (*kind) {
        case OpKind::add:     return AddOp{*std::move(path), *std::move(value)};
        case OpKind::remove:  return RemoveOp{*std::move(path)};
        case OpKind::replace: return ReplaceOp{*std::move(path), *std::move(value)};
        case OpKind::move:    return MoveOp{*std::move(from), *std::move(path)};
        case OpKind::copy:    return CopyOp{*std::move(from), *std::move(path)};
        case OpKind::test:    return TestOp{*std::move(path), *std::move(value)};
    }
    return std::nullopt;
}

auto parse_patch_into(const nlohmann::json& j, const std::string& context,
                      std::vector<std::string>& errors) -> Patch {
    auto patch = Patch{};
    if (!j.is_array()) {
        errors.push_back(context + "patch must be an array");
        return patch;
    }
    patch.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        if (auto op = parse_operation(j[i], context + op_prefix(i), errors)) {
            patch.push_back(*std::move(op));
        }
    }
    return patch;
}

auto strings_from(const nlohmann::json& j, const char* key, std::vector<std::string>& errors)
    -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    if (!j.is_array()) {
        errors.push_back(std::string{"'"} + key + "' must be an array of strings");
        return result;
    }
    for (const auto& item : j) {
        if (!item.is_string()) {
            errors.push_back(std::string{"'"} + key + "' must be an array of strings");
            return {};
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Value tree ---------------------------------------------------------------

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Array& a) {
            j = nlohmann::json::array();
            for (const auto& item : a) j.push_back(nlohmann::json(item));
        },
        [&](const Object& o) {
            j = nlohmann::json::object();
            for (const auto& [key, item] : o) j[key] = nlohmann::json(item);
        },
    }, v.storage());
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Value{};
            return;
        case nlohmann::json::value_t::boolean:
            v = Value{j.get<bool>()};
            return;
        case nlohmann::json::value_t::number_integer:
            v = Value{j.get<std::int64_t>()};
            return;
        case nlohmann::json::value_t::number_unsigned:
            v = Value{j.get<std::uint64_t>()};
            return;
        case nlohmann::json::value_t::number_float:
            v = Value{j.get<double>()};
            return;
        case nlohmann::json::value_t::string:
            v = Value{j.get<std::string>()};
            return;
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& item : j) arr.push_back(item.get<Value>());
            v = Value{std::move(arr)};
            return;
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (const auto& [key, item] : j.items()) obj.put(key, item.get<Value>());
            v = Value{std::move(obj)};
            return;
        }
        default:
            throw std::runtime_error{"cannot convert JSON to Value"};
    }
}

// -- Operations ---------------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{{"op", std::string{to_string_view(kind_of(op))}}};
    std::visit(overload{
        [&](const AddOp& o) { j["path"] = o.path; j["value"] = nlohmann::json(o.value); },
        [&](const RemoveOp& o) { j["path"] = o.path; },
        [&](const ReplaceOp& o) { j["path"] = o.path; j["value"] = nlohmann::json(o.value); },
        [&](const MoveOp& o) { j["from"] = o.from; j["path"] = o.path; },
        [&](const CopyOp& o) { j["from"] = o.from; j["path"] = o.path; },
        [&](const TestOp& o) { j["path"] = o.path; j["value"] = nlohmann::json(o.value); },
    }, op);
}

void from_json(const nlohmann::json& j, Operation& op) {
    auto errors = std::vector<std::string>{};
    auto parsed = parse_operation(j, "", errors);
    if (!parsed) throw std::runtime_error{"invalid patch operation: " + join(errors)};
    op = *std::move(parsed);
}

// -- Documents and results ----------------------------------------------------

void to_json(nlohmann::json& j, const Document& d) {
    j = nlohmann::json{
        {"content", nlohmann::json(d.content)},
        {"version", d.version},
        {"content_hash", d.content_hash},
    };
}

void from_json(const nlohmann::json& j, Document& d) {
    d.content = j.at("content").get<Value>();
    d.version = j.at("version").get<std::int64_t>();
    d.content_hash = j.at("content_hash").get<std::string>();
    if (d.version < 1) throw std::runtime_error{"document version must be at least 1"};
    if (!all_numbers_finite(d.content)) {
        throw std::runtime_error{"document content contains a non-finite number"};
    }
    if (!is_content_hash(d.content_hash)) {
        throw std::runtime_error{"malformed content hash: " + d.content_hash};
    }
}

void to_json(nlohmann::json& j, const PatchResult& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"new_version", r.new_version},
        {"content_hash", r.content_hash},
        {"inverse_patch", r.inverse_patch},
        {"applied_at", r.applied_at},
        {"dry_run", r.dry_run},
    };
}

void to_json(nlohmann::json& j, const PatchRequest& r) {
    j = nlohmann::json{
        {"document_version", r.document_version},
        {"patch", r.patch},
        {"evidence", r.evidence},
        {"dry_run", r.dry_run},
    };
    if (r.actor) {
        j["actor"] = *r.actor;
    } else {
        j["actor"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const ValidationResult& r) {
    j = nlohmann::json{{"is_valid", r.is_valid}, {"errors", r.errors}};
}

void to_json(nlohmann::json& j, const AuditEntry& e) {
    j = nlohmann::json(to_value(e));
}

void from_json(const nlohmann::json& j, AuditEntry& e) {
    auto entry = audit_entry_from_value(j.get<Value>());
    if (!entry) throw std::runtime_error{"invalid audit entry: " + entry.error()};
    e = *std::move(entry);
}

void to_json(nlohmann::json& j, const AuditChainReport& r) {
    j = nlohmann::json{{"ok", r.ok}, {"checked", r.checked}, {"reason", r.reason}};
    if (r.failed_index) {
        j["failed_index"] = *r.failed_index;
    } else {
        j["failed_index"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const PatchError& e) {
    j = nlohmann::json{
        {"error", std::string{to_string_view(kind_of(e))}},
        {"message", describe(e)},
    };
    std::visit(overload{
        [&](const PatchValidationError& v) { j["errors"] = v.errors; },
        [&](const OptimisticLockError& v) {
            j["expected"] = v.expected;
            j["actual"] = v.actual;
        },
        [&](const InverseGenerationError& v) {
            j["op_index"] = v.op_index;
            j["reason"] = v.reason;
        },
        [&](const PatchApplicationError& v) {
            j["op_index"] = v.op_index;
            j["reason"] = v.reason;
        },
        [&](const InvalidDocumentError& v) { j["reason"] = v.reason; },
    }, e);
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const EngineOptions& o) {
    j = nlohmann::json{
        {"max_operations", o.max_operations},
        {"audit_pointer", o.audit_pointer},
        {"versioning_pointer", o.versioning_pointer},
        {"updated_at_pointer", o.updated_at_pointer},
        {"record_versioning_metadata", o.record_versioning_metadata},
        {"log_level", std::string{to_string_view(o.log_level)}},
    };
}

void from_json(const nlohmann::json& j, EngineOptions& o) {
    if (!j.is_object()) throw std::runtime_error{"engine options must be a JSON object"};
    if (j.contains("max_operations")) {
        o.max_operations = j.at("max_operations").get<std::size_t>();
    }
    if (j.contains("audit_pointer")) {
        o.audit_pointer = j.at("audit_pointer").get<std::string>();
    }
    if (j.contains("versioning_pointer")) {
        o.versioning_pointer = j.at("versioning_pointer").get<std::string>();
    }
    if (j.contains("updated_at_pointer")) {
        o.updated_at_pointer = j.at("updated_at_pointer").get<std::string>();
    }
    if (j.contains("record_versioning_metadata")) {
        o.record_versioning_metadata = j.at("record_versioning_metadata").get<bool>();
    }
    if (j.contains("log_level")) {
        auto name = j.at("log_level").get<std::string>();
        auto level = parse_log_level(name);
        if (!level) throw std::runtime_error{"unknown log level: " + name};
        o.log_level = *level;
    }
}

// =============================================================================
// Wire-level parsing
// =============================================================================

auto parse_patch(const nlohmann::json& j) -> Result<Patch, PatchValidationError> {
    auto errors = std::vector<std::string>{};
    auto patch = parse_patch_into(j, "", errors);
    if (!errors.empty()) return fail(PatchValidationError{std::move(errors)});
    return patch;
}

auto parse_request(const nlohmann::json& j) -> Result<PatchRequest, PatchValidationError> {
    if (!j.is_object()) {
        return fail(PatchValidationError{{"request must be an object"}});
    }
    auto errors = std::vector<std::string>{};
    auto request = PatchRequest{};

    if (auto it = j.find("document_version"); it == j.end()) {
        errors.emplace_back("missing 'document_version'");
    } else if (!it->is_number_integer()) {
        errors.emplace_back("'document_version' must be an integer");
    } else {
        request.document_version = it->get<std::int64_t>();
    }

    if (auto it = j.find("patch"); it == j.end()) {
        errors.emplace_back("missing 'patch'");
    } else {
        request.patch = parse_patch_into(*it, "", errors);
    }

    if (auto it = j.find("evidence"); it != j.end() && !it->is_null()) {
        request.evidence = strings_from(*it, "evidence", errors);
    }

    if (auto it = j.find("dry_run"); it != j.end()) {
        if (it->is_boolean()) {
            request.dry_run = it->get<bool>();
        } else {
            errors.emplace_back("'dry_run' must be a boolean");
        }
    }

    if (auto it = j.find("actor"); it != j.end() && !it->is_null()) {
        if (it->is_string()) {
            request.actor = it->get<std::string>();
        } else {
            errors.emplace_back("'actor' must be a string or null");
        }
    }

    if (!errors.empty()) return fail(PatchValidationError{std::move(errors)});
    return request;
}

}  // namespace docpatch_cpp
