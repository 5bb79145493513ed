#include <docpatch-cpp/audit.hpp>
#include <docpatch-cpp/engine.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace docpatch_cpp;

namespace {

const auto hash_a = "sha256:" + std::string(64, 'a');
const auto hash_b = "sha256:" + std::string(64, 'b');
const auto stamp = std::string{"2026-01-02T03:04:05.678Z"};

auto sample_entry() -> AuditEntry {
    auto entry = AuditEntry{};
    entry.actor = "alice";
    entry.timestamp = stamp;
    entry.version = 2;
    entry.content_hash = hash_b;
    entry.previous_hash = hash_a;
    entry.patch_operations = 2;
    entry.operations = {"replace", "add"};
    entry.evidence = {"ticket-42"};
    return entry;
}

auto quiet_engine() -> PatchEngine {
    auto options = EngineOptions{};
    options.log_level = LogLevel::off;
    return PatchEngine{options};
}

// A document with three committed versions.
auto committed_document(const PatchEngine& engine) -> Document {
    auto doc = *engine.create_document(Object{{"field", 1}});
    for (int i = 2; i <= 3; ++i) {
        auto request = PatchRequest{};
        request.document_version = doc.version;
        request.patch = {ReplaceOp{"/field", i}};
        request.actor = "ci";
        auto result = engine.apply_in_place(doc, request);
        EXPECT_TRUE(result) << describe(result.error());
    }
    return doc;
}

auto audit_array(Document& doc) -> Array& {
    return doc.content.as_object().find("audit")->as_array();
}

}  // namespace

// -- AuditEntry ---------------------------------------------------------------

TEST(AuditEntry, value_layout) {
    const auto value = to_value(sample_entry());
    const auto& object = value.as_object();
    EXPECT_EQ(*object.find("action"), Value{"patch_applied"});
    EXPECT_EQ(*object.find("actor"), Value{"alice"});
    EXPECT_EQ(*object.find("version"), Value{2});
    const auto& details = object.find("details")->as_object();
    EXPECT_EQ(*details.find("patch_operations"), Value{2});
    EXPECT_EQ(*details.find("operations"), (Value{Array{"replace", "add"}}));
    EXPECT_EQ(*details.find("evidence"), (Value{Array{"ticket-42"}}));
}

TEST(AuditEntry, missing_actor_is_null) {
    auto entry = sample_entry();
    entry.actor.reset();
    EXPECT_TRUE(to_value(entry).as_object().find("actor")->is_null());
}

TEST(AuditEntry, decodes_what_it_encodes) {
    auto entry = sample_entry();
    entry.actor.reset();
    auto decoded = audit_entry_from_value(to_value(entry));
    ASSERT_TRUE(decoded) << decoded.error();
    EXPECT_EQ(*decoded, entry);
}

TEST(AuditEntry, decode_rejects_bad_members) {
    auto value = to_value(sample_entry());
    value.as_object().put("timestamp", "yesterday");
    auto decoded = audit_entry_from_value(value);
    ASSERT_FALSE(decoded);
    EXPECT_NE(decoded.error().find("timestamp"), std::string::npos);

    value = to_value(sample_entry());
    value.as_object().erase("details");
    decoded = audit_entry_from_value(value);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error(), "missing member 'details'");

    EXPECT_FALSE(audit_entry_from_value(Value{42}));
}

// -- AuditRecorder ------------------------------------------------------------

TEST(AuditRecorder, make_entry_summarizes_patch) {
    const auto recorder = AuditRecorder{EngineOptions{}};
    const auto entry = recorder.make_entry({ReplaceOp{"/a", 1}, TestOp{"/a", 1}, AddOp{"/b", 2}},
                                           "bob", {"e1"}, stamp, 5, hash_b, hash_a);
    EXPECT_EQ(entry.action, "patch_applied");
    EXPECT_EQ(entry.actor, "bob");
    EXPECT_EQ(entry.version, 5);
    EXPECT_EQ(entry.patch_operations, 3u);
    EXPECT_EQ(entry.operations, (std::vector<std::string>{"replace", "test", "add"}));
    EXPECT_EQ(entry.evidence, (std::vector<std::string>{"e1"}));
}

TEST(AuditRecorder, prepare_creates_enclosing_objects) {
    const auto recorder = AuditRecorder{EngineOptions{}};
    auto content = Value{Object{{"field", 1}}};
    ASSERT_TRUE(recorder.prepare(content));
    EXPECT_EQ(*content.as_object().find("meta"), (Value{Object{{"timestamps", Object{}}}}));
    EXPECT_FALSE(content.as_object().contains("audit"));
}

TEST(AuditRecorder, record_appends_and_mirrors_hashes) {
    const auto recorder = AuditRecorder{EngineOptions{}};
    auto content = Value{Object{{"field", 1}}};
    ASSERT_TRUE(recorder.record(content, sample_entry()));
    ASSERT_TRUE(recorder.record(content, sample_entry()));

    EXPECT_EQ(content.as_object().find("audit")->as_array().size(), 2u);
    const auto& meta = content.as_object().find("meta")->as_object().find("versioning")->as_object();
    EXPECT_EQ(*meta.find("content_hash"), Value{hash_b});
    EXPECT_EQ(*meta.find("previous_hash"), Value{hash_a});
}

TEST(AuditRecorder, record_mirrors_timestamp) {
    const auto recorder = AuditRecorder{EngineOptions{}};
    auto content = Value{Object{{"meta", Object{{"timestamps", Object{{"created_at", "x"}}}}}}};
    ASSERT_TRUE(recorder.record(content, sample_entry()));
    const auto& timestamps =
        content.as_object().find("meta")->as_object().find("timestamps")->as_object();
    EXPECT_EQ(*timestamps.find("updated_at"), Value{stamp});
    EXPECT_EQ(*timestamps.find("created_at"), Value{"x"});
}

TEST(AuditRecorder, custom_updated_at_pointer) {
    auto options = EngineOptions{};
    options.updated_at_pointer = "/modified";
    const auto recorder = AuditRecorder{options};
    auto content = Value{Object{}};
    ASSERT_TRUE(recorder.record(content, sample_entry()));
    EXPECT_EQ(*content.as_object().find("modified"), Value{stamp});
    EXPECT_FALSE(content.as_object().find("meta")->as_object().contains("timestamps"));
}

TEST(AuditRecorder, versioning_can_be_disabled) {
    auto options = EngineOptions{};
    options.record_versioning_metadata = false;
    const auto recorder = AuditRecorder{options};
    auto content = Value{Object{}};
    ASSERT_TRUE(recorder.record(content, sample_entry()));
    EXPECT_FALSE(content.as_object().contains("meta"));
    EXPECT_TRUE(content.as_object().contains("audit"));
}

TEST(AuditRecorder, nested_pointers) {
    auto options = EngineOptions{};
    options.audit_pointer = "/history/log";
    options.versioning_pointer = "/header/version";
    const auto recorder = AuditRecorder{options};
    auto content = Value{Object{}};
    ASSERT_TRUE(recorder.record(content, sample_entry()));
    EXPECT_TRUE(content.as_object().find("history")->as_object().find("log")->is_array());
    EXPECT_TRUE(content.as_object().find("header")->as_object().find("version")->is_object());
}

TEST(AuditRecorder, record_fails_on_wrong_shapes) {
    const auto recorder = AuditRecorder{EngineOptions{}};
    auto content = Value{Object{{"audit", "text"}}};
    auto recorded = recorder.record(content, sample_entry());
    ASSERT_FALSE(recorded);
    EXPECT_NE(recorded.error().find("not an array"), std::string::npos);

    content = Object{{"meta", 3}};
    EXPECT_FALSE(recorder.record(content, sample_entry()));
}

TEST(AuditRecorder, rejects_invalid_options) {
    auto options = EngineOptions{};
    options.audit_pointer = "audit";
    EXPECT_THROW(AuditRecorder{options}, std::invalid_argument);
}

// -- read_audit_log -----------------------------------------------------------

TEST(ReadAuditLog, empty_without_audit_array) {
    auto doc = *Document::create(Object{{"x", 1}}, ContentHasher{});
    auto log = read_audit_log(doc, EngineOptions{});
    ASSERT_TRUE(log);
    EXPECT_TRUE(log->empty());
}

TEST(ReadAuditLog, decodes_committed_entries) {
    const auto engine = quiet_engine();
    const auto doc = committed_document(engine);
    auto log = read_audit_log(doc, engine.options());
    ASSERT_TRUE(log) << log.error();
    ASSERT_EQ(log->size(), 2u);
    EXPECT_EQ((*log)[0].version, 2);
    EXPECT_EQ((*log)[1].version, 3);
    EXPECT_EQ((*log)[1].content_hash, doc.content_hash);
    EXPECT_EQ((*log)[1].previous_hash, (*log)[0].content_hash);
    EXPECT_EQ((*log)[0].actor, "ci");
}

TEST(ReadAuditLog, reports_bad_entry_index) {
    const auto engine = quiet_engine();
    auto doc = committed_document(engine);
    audit_array(doc)[1] = "garbage";
    auto log = read_audit_log(doc, engine.options());
    ASSERT_FALSE(log);
    EXPECT_EQ(log.error().rfind("audit entry 1: ", 0), 0u);
}

// -- verify_audit_chain -------------------------------------------------------

TEST(VerifyAuditChain, fresh_document_is_ok) {
    const auto engine = quiet_engine();
    auto doc = *engine.create_document(Object{});
    const auto report = verify_audit_chain(doc, engine.options());
    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.checked, 0u);
}

TEST(VerifyAuditChain, committed_history_is_ok) {
    const auto engine = quiet_engine();
    const auto doc = committed_document(engine);
    const auto report = engine.verify_audit_chain(doc);
    EXPECT_TRUE(report.ok) << report.reason;
    EXPECT_EQ(report.checked, 2u);
    EXPECT_FALSE(report.failed_index);
}

TEST(VerifyAuditChain, missing_entries_fail) {
    const auto engine = quiet_engine();
    auto doc = *engine.create_document(Object{});
    doc.version = 4;
    const auto report = verify_audit_chain(doc, engine.options());
    EXPECT_FALSE(report.ok);
}

TEST(VerifyAuditChain, broken_link_is_located) {
    const auto engine = quiet_engine();
    auto doc = committed_document(engine);
    audit_array(doc)[1].as_object().put("previous_hash", hash_a);
    const auto report = verify_audit_chain(doc, engine.options());
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.failed_index, 1u);
    EXPECT_NE(report.reason.find("previous_hash"), std::string::npos);
}

TEST(VerifyAuditChain, version_gap_is_located) {
    const auto engine = quiet_engine();
    auto doc = committed_document(engine);
    audit_array(doc)[1].as_object().put("version", 7);
    const auto report = verify_audit_chain(doc, engine.options());
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.failed_index, 1u);
}

TEST(VerifyAuditChain, stale_document_hash_fails) {
    const auto engine = quiet_engine();
    auto doc = committed_document(engine);
    doc.content_hash = hash_a;
    const auto report = verify_audit_chain(doc, engine.options());
    EXPECT_FALSE(report.ok);
    EXPECT_NE(report.reason.find("content_hash"), std::string::npos);
}

TEST(VerifyAuditChain, tampered_versioning_metadata_fails) {
    const auto engine = quiet_engine();
    auto doc = committed_document(engine);
    doc.content.as_object().find("meta")->as_object().find("versioning")->as_object()
        .put("content_hash", hash_a);
    const auto report = verify_audit_chain(doc, engine.options());
    EXPECT_FALSE(report.ok);
    EXPECT_NE(report.reason.find("versioning metadata"), std::string::npos);
}

TEST(VerifyAuditChain, tampered_updated_at_fails) {
    const auto engine = quiet_engine();
    auto doc = committed_document(engine);
    doc.content.as_object().find("meta")->as_object().find("timestamps")->as_object()
        .put("updated_at", "1999-01-01T00:00:00.000Z");
    const auto report = verify_audit_chain(doc, engine.options());
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.failed_index, 1u);
    EXPECT_NE(report.reason.find("updated_at"), std::string::npos);
}
