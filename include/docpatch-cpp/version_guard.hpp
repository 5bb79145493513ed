/// @file version_guard.hpp
/// @brief Optimistic concurrency check on document versions.

#pragma once

#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/result.hpp>

#include <cstdint>

namespace docpatch_cpp {

/// Reject a write whose expected version is not the current one.
///
/// @code
/// auto ok = check_version(3, 2);
/// // ok.error() == OptimisticLockError{.expected = 2, .actual = 3}
/// @endcode
auto check_version(std::int64_t current, std::int64_t expected)
    -> Result<void, OptimisticLockError>;

}  // namespace docpatch_cpp
