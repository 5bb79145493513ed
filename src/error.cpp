#include <docpatch-cpp/error.hpp>

#include <docpatch-cpp/value.hpp>

namespace docpatch_cpp {

auto kind_of(const PatchError& error) -> ErrorKind {
    return std::visit(overload{
        [](const PatchValidationError&) { return ErrorKind::patch_validation; },
        [](const OptimisticLockError&) { return ErrorKind::optimistic_lock; },
        [](const InverseGenerationError&) { return ErrorKind::inverse_generation; },
        [](const PatchApplicationError&) { return ErrorKind::patch_application; },
        [](const InvalidDocumentError&) { return ErrorKind::invalid_document; },
    }, error);
}

auto describe(const PatchError& error) -> std::string {
    return std::visit(overload{
        [](const PatchValidationError& e) {
            auto text = std::string{"patch validation failed"};
            for (std::size_t i = 0; i < e.errors.size(); ++i) {
                text += (i == 0) ? ": " : "; ";
                text += e.errors[i];
            }
            return text;
        },
        [](const OptimisticLockError& e) {
            return "version conflict: expected " + std::to_string(e.expected) +
                   ", document is at " + std::to_string(e.actual);
        },
        [](const InverseGenerationError& e) {
            return "cannot invert operation " + std::to_string(e.op_index) + ": " + e.reason;
        },
        [](const PatchApplicationError& e) {
            return "operation " + std::to_string(e.op_index) + " failed: " + e.reason;
        },
        [](const InvalidDocumentError& e) {
            return "invalid document: " + e.reason;
        },
    }, error);
}

}  // namespace docpatch_cpp
