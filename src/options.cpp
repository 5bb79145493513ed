#include <docpatch-cpp/options.hpp>

#include <docpatch-cpp/json.hpp>
#include <docpatch-cpp/pointer.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

namespace docpatch_cpp {

namespace {

auto require_region_pointer(const std::string& text, const char* name) -> Pointer {
    auto pointer = Pointer::parse(text);
    if (!pointer) {
        throw std::invalid_argument{std::string{name} + " '" + text +
                                    "' is not a valid pointer: " + pointer.error().message};
    }
    if (pointer->is_root()) {
        throw std::invalid_argument{std::string{name} + " must not be the document root"};
    }
    return *std::move(pointer);
}

}  // anonymous namespace

void validate_options(const EngineOptions& options) {
    if (options.max_operations == 0) {
        throw std::invalid_argument{"max_operations must be at least 1"};
    }
    const auto audit = require_region_pointer(options.audit_pointer, "audit_pointer");
    const auto versioning =
        require_region_pointer(options.versioning_pointer, "versioning_pointer");
    const auto updated_at =
        require_region_pointer(options.updated_at_pointer, "updated_at_pointer");

    auto require_disjoint = [](const Pointer& a, const char* a_name,
                               const Pointer& b, const char* b_name) {
        if (a.is_prefix_of(b) || b.is_prefix_of(a)) {
            throw std::invalid_argument{std::string{a_name} + " and " + b_name +
                                        " must not overlap"};
        }
    };
    require_disjoint(audit, "audit_pointer", versioning, "versioning_pointer");
    require_disjoint(audit, "audit_pointer", updated_at, "updated_at_pointer");
    require_disjoint(versioning, "versioning_pointer", updated_at, "updated_at_pointer");
}

auto load_options(const std::filesystem::path& path) -> EngineOptions {
    auto in = std::ifstream{path};
    if (!in) {
        throw std::runtime_error{"cannot open options file " + path.string()};
    }
    auto options = nlohmann::json::parse(in).get<EngineOptions>();
    validate_options(options);
    return options;
}

}  // namespace docpatch_cpp
