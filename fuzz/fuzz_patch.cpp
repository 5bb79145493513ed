// Fuzz target for the wire-to-engine path: the input is parsed as a patch,
// then applied (as a dry run and as a commit) to a fixed document. Any
// committed result must pass its own hash and audit chain checks.

#include <docpatch-cpp/docpatch.hpp>
#include <docpatch-cpp/json.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

namespace dp = docpatch_cpp;

static auto make_engine() -> dp::PatchEngine {
    auto options = dp::EngineOptions{};
    options.log_level = dp::LogLevel::off;
    return dp::PatchEngine{options};
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto engine = make_engine();
    static const auto base = *engine.create_document(dp::Object{
        {"field", 1},
        {"list", dp::Array{1, 2, 3}},
        {"nested", dp::Object{{"inner", dp::Object{{"x", true}}}}},
    });

    const auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) return 0;

    auto patch = dp::parse_patch(j);
    if (!patch) return 0;

    auto request = dp::PatchRequest{};
    request.document_version = base.version;
    request.patch = *std::move(patch);

    request.dry_run = true;
    auto dry = engine.apply(base, request);

    request.dry_run = false;
    auto outcome = engine.apply(base, request);
    if (static_cast<bool>(dry) != static_cast<bool>(outcome)) std::abort();
    if (!outcome) return 0;

    if (dry->result.content_hash != outcome->result.content_hash) std::abort();
    if (!engine.verify(outcome->document)) std::abort();
    if (!engine.verify_audit_chain(outcome->document).ok) std::abort();
    return 0;
}
