#include <docpatch-cpp/version_guard.hpp>

namespace docpatch_cpp {

auto check_version(std::int64_t current, std::int64_t expected)
    -> Result<void, OptimisticLockError> {
    if (current != expected) {
        return fail(OptimisticLockError{expected, current});
    }
    return {};
}

}  // namespace docpatch_cpp
