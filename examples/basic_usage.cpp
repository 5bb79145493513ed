// basic_usage: demonstrates the core docpatch-cpp API
//
// Creates a document, applies a patch, previews another with a dry run,
// shows a rejected request, rolls back with the inverse patch and checks
// the audit chain. Requests and results go over the wire as JSON.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <docpatch-cpp/docpatch.hpp>
#include <docpatch-cpp/json.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace dp = docpatch_cpp;
using json = nlohmann::json;

int main() {
    auto options = dp::EngineOptions{};
    options.log_level = dp::LogLevel::debug;
    const auto engine = dp::PatchEngine{options};

    // -- Create version 1 -----------------------------------------------------
    auto created = engine.create_document(dp::Object{
        {"site", dp::Object{{"name", "North Array"}, {"capacity_kw", 1200}}},
        {"inverters", dp::Array{"INV-1", "INV-2"}},
    });
    if (!created) {
        std::printf("create failed: %s\n", created.error().message.c_str());
        return 1;
    }
    auto doc = *std::move(created);
    std::printf("v%lld %s\n", static_cast<long long>(doc.version), doc.content_hash.c_str());

    // -- A request as it would arrive over the wire ---------------------------
    const auto wire = json::parse(R"({
        "document_version": 1,
        "patch": [
            {"op": "replace", "path": "/site/capacity_kw", "value": 1500},
            {"op": "add", "path": "/inverters/-", "value": "INV-3"}
        ],
        "evidence": ["commissioning-report-7"],
        "actor": "alice"
    })");
    auto request = dp::parse_request(wire);
    if (!request) {
        std::printf("bad request: %s\n", dp::describe(dp::PatchError{request.error()}).c_str());
        return 1;
    }

    // -- Preview with a dry run -----------------------------------------------
    auto preview = *request;
    preview.dry_run = true;
    if (auto dry = engine.apply(doc, preview)) {
        std::printf("dry run: %s\n", json(dry->result).dump().c_str());
    }

    // -- Commit ---------------------------------------------------------------
    auto committed = engine.apply_in_place(doc, *request);
    if (!committed) {
        std::printf("rejected: %s\n", dp::describe(committed.error()).c_str());
        return 1;
    }
    std::printf("v%lld %s\n", static_cast<long long>(doc.version), doc.content_hash.c_str());
    std::printf("inverse: %s\n", json(committed->inverse_patch).dump().c_str());

    // -- A stale version is refused -------------------------------------------
    auto stale = dp::PatchRequest{};
    stale.document_version = 1;
    stale.patch = {dp::RemoveOp{"/site"}};
    if (auto refused = engine.apply(doc, stale); !refused) {
        std::printf("refused: %s\n", json(refused.error()).dump().c_str());
    }

    // -- Roll back with the inverse -------------------------------------------
    auto rollback = dp::PatchRequest{};
    rollback.document_version = doc.version;
    rollback.patch = committed->inverse_patch;
    rollback.actor = "alice";
    rollback.evidence = {"rollback"};
    if (auto undone = engine.apply_in_place(doc, rollback); !undone) {
        std::printf("rollback failed: %s\n", dp::describe(undone.error()).c_str());
        return 1;
    }
    std::printf("v%lld %s\n", static_cast<long long>(doc.version), doc.content_hash.c_str());

    // -- Audit trail ----------------------------------------------------------
    if (auto log = engine.audit_log(doc)) {
        for (const auto& entry : *log) {
            std::printf("  v%lld by %s at %s: %zu operations\n",
                        static_cast<long long>(entry.version),
                        entry.actor.value_or("unknown").c_str(),
                        entry.timestamp.c_str(),
                        entry.patch_operations);
        }
    }
    const auto report = engine.verify_audit_chain(doc);
    std::printf("audit chain: %s (%zu entries)\n", report.ok ? "ok" : report.reason.c_str(),
                report.checked);

    std::printf("%s\n", json(doc.content).dump(2).c_str());
    return 0;
}
