#include <docpatch-cpp/audit.hpp>

#include "timestamp.hpp"

#include <stdexcept>
#include <utility>

namespace docpatch_cpp {

namespace {

auto parse_region(const std::string& text, const char* name) -> Pointer {
    auto pointer = Pointer::parse(text);
    if (!pointer) {
        throw std::invalid_argument{std::string{name} + ": " + pointer.error().message};
    }
    return *std::move(pointer);
}

// Walk `count` tokens of `pointer`, creating missing members as objects.
auto ensure_objects(Value& root, const Pointer& pointer, std::size_t count)
    -> Result<Value*, std::string> {
    Value* current = &root;
    auto walked = Pointer{};
    for (std::size_t i = 0; i < count; ++i) {
        if (!current->is_object()) {
            return fail("'" + walked.to_string() + "' is a " +
                        std::string{to_string_view(current->type())} + ", expected an object");
        }
        const auto& token = pointer.tokens()[i];
        auto& object = current->as_object();
        if (!object.contains(token)) object.put(token, Object{});
        current = object.find(token);
        walked = walked.child(token);
    }
    return current;
}

auto strings_to_value(const std::vector<std::string>& strings) -> Value {
    auto arr = Array{};
    arr.reserve(strings.size());
    for (const auto& s : strings) arr.emplace_back(s);
    return arr;
}

auto member(const Object& object, std::string_view key) -> Result<const Value*, std::string> {
    const auto* value = object.find(key);
    if (!value) return fail("missing member '" + std::string{key} + "'");
    return value;
}

auto string_member(const Object& object, std::string_view key) -> Result<std::string, std::string> {
    auto value = member(object, key);
    if (!value) return fail(std::move(value).error());
    if (!(*value)->is_string()) return fail("member '" + std::string{key} + "' must be a string");
    return (*value)->as_string();
}

auto string_list_member(const Object& object, std::string_view key)
    -> Result<std::vector<std::string>, std::string> {
    auto value = member(object, key);
    if (!value) return fail(std::move(value).error());
    if (!(*value)->is_array()) return fail("member '" + std::string{key} + "' must be an array");
    auto result = std::vector<std::string>{};
    for (const auto& item : (*value)->as_array()) {
        if (!item.is_string()) {
            return fail("member '" + std::string{key} + "' must hold only strings");
        }
        result.push_back(item.as_string());
    }
    return result;
}

auto integer_member(const Object& object, std::string_view key) -> Result<std::int64_t, std::string> {
    auto value = member(object, key);
    if (!value) return fail(std::move(value).error());
    auto i = get_as<std::int64_t>(**value);
    if (!i) return fail("member '" + std::string{key} + "' must be an integer");
    return *i;
}

auto chain_failure(std::size_t checked, std::size_t index, std::string reason)
    -> AuditChainReport {
    return AuditChainReport{false, checked, index, std::move(reason)};
}

}  // anonymous namespace

// -- AuditEntry ---------------------------------------------------------------

auto to_value(const AuditEntry& entry) -> Value {
    return Object{
        {"action", entry.action},
        {"actor", entry.actor ? Value{*entry.actor} : Value{Null{}}},
        {"timestamp", entry.timestamp},
        {"version", entry.version},
        {"content_hash", entry.content_hash},
        {"previous_hash", entry.previous_hash},
        {"details", Object{
            {"patch_operations", entry.patch_operations},
            {"operations", strings_to_value(entry.operations)},
            {"evidence", strings_to_value(entry.evidence)},
        }},
    };
}

auto audit_entry_from_value(const Value& value) -> Result<AuditEntry, std::string> {
    if (!value.is_object()) return fail(std::string{"audit entry must be an object"});
    const auto& object = value.as_object();
    auto entry = AuditEntry{};

    auto action = string_member(object, "action");
    if (!action) return fail(std::move(action).error());
    entry.action = *std::move(action);

    auto actor = member(object, "actor");
    if (!actor) return fail(std::move(actor).error());
    if ((*actor)->is_string()) {
        entry.actor = (*actor)->as_string();
    } else if (!(*actor)->is_null()) {
        return fail(std::string{"member 'actor' must be a string or null"});
    }

    auto timestamp = string_member(object, "timestamp");
    if (!timestamp) return fail(std::move(timestamp).error());
    if (!detail::parse_timestamp(*timestamp)) {
        return fail("member 'timestamp' is not an ISO-8601 UTC timestamp: " + *timestamp);
    }
    entry.timestamp = *std::move(timestamp);

    auto version = integer_member(object, "version");
    if (!version) return fail(std::move(version).error());
    entry.version = *version;

    auto content_hash = string_member(object, "content_hash");
    if (!content_hash) return fail(std::move(content_hash).error());
    entry.content_hash = *std::move(content_hash);

    auto previous_hash = string_member(object, "previous_hash");
    if (!previous_hash) return fail(std::move(previous_hash).error());
    entry.previous_hash = *std::move(previous_hash);

    auto details = member(object, "details");
    if (!details) return fail(std::move(details).error());
    if (!(*details)->is_object()) return fail(std::string{"member 'details' must be an object"});
    const auto& details_object = (*details)->as_object();

    auto count = integer_member(details_object, "patch_operations");
    if (!count) return fail(std::move(count).error());
    if (*count < 0) return fail(std::string{"member 'patch_operations' must not be negative"});
    entry.patch_operations = static_cast<std::size_t>(*count);

    auto operations = string_list_member(details_object, "operations");
    if (!operations) return fail(std::move(operations).error());
    entry.operations = *std::move(operations);

    auto evidence = string_list_member(details_object, "evidence");
    if (!evidence) return fail(std::move(evidence).error());
    entry.evidence = *std::move(evidence);

    return entry;
}

// -- AuditRecorder ------------------------------------------------------------

AuditRecorder::AuditRecorder(const EngineOptions& options)
    : audit_{parse_region(options.audit_pointer, "audit_pointer")},
      versioning_{parse_region(options.versioning_pointer, "versioning_pointer")},
      updated_at_{parse_region(options.updated_at_pointer, "updated_at_pointer")},
      record_versioning_{options.record_versioning_metadata} {
    validate_options(options);
}

auto AuditRecorder::make_entry(const Patch& patch,
                               std::optional<std::string> actor,
                               std::vector<std::string> evidence,
                               std::string timestamp,
                               std::int64_t version,
                               std::string content_hash,
                               std::string previous_hash) const -> AuditEntry {
    auto entry = AuditEntry{};
    entry.actor = std::move(actor);
    entry.timestamp = std::move(timestamp);
    entry.version = version;
    entry.content_hash = std::move(content_hash);
    entry.previous_hash = std::move(previous_hash);
    entry.patch_operations = patch.size();
    entry.operations = operation_kinds(patch);
    entry.evidence = std::move(evidence);
    return entry;
}

auto AuditRecorder::prepare(Value& content) const -> Result<void, std::string> {
    if (auto r = ensure_objects(content, audit_, audit_.size() - 1); !r) {
        return fail("audit log: " + std::move(r).error());
    }
    if (record_versioning_) {
        if (auto r = ensure_objects(content, versioning_, versioning_.size() - 1); !r) {
            return fail("versioning metadata: " + std::move(r).error());
        }
        if (auto r = ensure_objects(content, updated_at_, updated_at_.size() - 1); !r) {
            return fail("updated_at timestamp: " + std::move(r).error());
        }
    }
    return {};
}

auto AuditRecorder::record(Value& content, const AuditEntry& entry) const
    -> Result<void, std::string> {
    if (record_versioning_) {
        auto meta = ensure_objects(content, versioning_, versioning_.size());
        if (!meta) return fail("versioning metadata: " + std::move(meta).error());
        if (!(*meta)->is_object()) {
            return fail("versioning metadata at '" + versioning_.to_string() +
                        "' is not an object");
        }
        auto& object = (*meta)->as_object();
        object.put("content_hash", entry.content_hash);
        object.put("previous_hash", entry.previous_hash);

        auto stamp_holder = ensure_objects(content, updated_at_, updated_at_.size() - 1);
        if (!stamp_holder) return fail("updated_at timestamp: " + std::move(stamp_holder).error());
        if (!(*stamp_holder)->is_object()) {
            return fail("updated_at timestamp: '" + updated_at_.parent().to_string() +
                        "' is not an object");
        }
        (*stamp_holder)->as_object().put(updated_at_.back(), entry.timestamp);
    }

    auto parent = ensure_objects(content, audit_, audit_.size() - 1);
    if (!parent) return fail("audit log: " + std::move(parent).error());
    if (!(*parent)->is_object()) {
        return fail("audit log: '" + audit_.parent().to_string() + "' is not an object");
    }
    auto& holder = (*parent)->as_object();
    if (!holder.contains(audit_.back())) holder.put(audit_.back(), Array{});
    auto* log = holder.find(audit_.back());
    if (!log->is_array()) {
        return fail("audit log at '" + audit_.to_string() + "' is not an array");
    }
    log->as_array().push_back(to_value(entry));
    return {};
}

// -- Reading and verification -------------------------------------------------

auto read_audit_log(const Document& document, const EngineOptions& options)
    -> Result<std::vector<AuditEntry>, std::string> {
    const auto audit = parse_region(options.audit_pointer, "audit_pointer");
    auto entries = std::vector<AuditEntry>{};

    auto log = find(document.content, audit);
    if (!log) return entries;
    if (!(*log)->is_array()) {
        return fail("audit log at '" + audit.to_string() + "' is not an array");
    }
    const auto& items = (*log)->as_array();
    entries.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto entry = audit_entry_from_value(items[i]);
        if (!entry) return fail("audit entry " + std::to_string(i) + ": " + entry.error());
        entries.push_back(*std::move(entry));
    }
    return entries;
}

auto verify_audit_chain(const Document& document, const EngineOptions& options)
    -> AuditChainReport {
    auto entries = read_audit_log(document, options);
    if (!entries) return AuditChainReport{false, 0, std::nullopt, entries.error()};

    if (entries->empty()) {
        if (document.version != 1) {
            return AuditChainReport{false, 0, std::nullopt,
                                    "document is at version " + std::to_string(document.version) +
                                        " but has no audit entries"};
        }
        return AuditChainReport{};
    }

    const auto& log = *entries;
    for (std::size_t i = 1; i < log.size(); ++i) {
        if (log[i].version != log[i - 1].version + 1) {
            return chain_failure(i + 1, i,
                                 "version " + std::to_string(log[i].version) + " does not follow " +
                                     std::to_string(log[i - 1].version));
        }
        if (log[i].previous_hash != log[i - 1].content_hash) {
            return chain_failure(i + 1, i, "previous_hash does not match the prior content_hash");
        }
    }

    const auto last = log.size() - 1;
    if (log[last].version != document.version) {
        return chain_failure(log.size(), last,
                             "last entry is version " + std::to_string(log[last].version) +
                                 ", document is at " + std::to_string(document.version));
    }
    if (log[last].content_hash != document.content_hash) {
        return chain_failure(log.size(), last, "last content_hash does not match the document");
    }

    if (options.record_versioning_metadata) {
        const auto versioning = parse_region(options.versioning_pointer, "versioning_pointer");
        if (auto meta = find(document.content, versioning.child(std::string{"content_hash"}));
            meta && !(**meta == Value{document.content_hash})) {
            return chain_failure(log.size(), last,
                                 "versioning metadata content_hash does not match the document");
        }
        const auto updated_at = parse_region(options.updated_at_pointer, "updated_at_pointer");
        if (auto stamp = find(document.content, updated_at);
            stamp && !(**stamp == Value{log[last].timestamp})) {
            return chain_failure(log.size(), last,
                                 "updated_at does not match the last entry's timestamp");
        }
    }
    return AuditChainReport{true, log.size(), std::nullopt, {}};
}

}  // namespace docpatch_cpp
