/// @file inverse.hpp
/// @brief Computing the patch that undoes another patch.

#pragma once

#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/operation.hpp>
#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/value.hpp>

namespace docpatch_cpp {

/// Compute the inverse of `patch` against the tree it will be applied to.
///
/// The patch is simulated on a copy of `pre_image`, so each operation is
/// inverted against the state it actually sees. Inverses are returned in
/// reverse operation order with every "-" turned into a concrete index;
/// applying them to the patched tree reproduces `pre_image`. Test
/// operations contribute nothing and are not evaluated here.
///
/// Fails with InverseGenerationError when an operation's pointer does not
/// resolve in `pre_image`, and with PatchApplicationError when it does but
/// an earlier operation of the same patch made it unusable.
///
/// @code
/// auto inverse = compute_inverse({ReplaceOp{"/field", 2}}, Value{Object{{"field", 1}}});
/// // *inverse == Patch{ReplaceOp{"/field", 1}}
/// @endcode
auto compute_inverse(const Patch& patch, const Value& pre_image) -> Result<Patch, PatchError>;

}  // namespace docpatch_cpp
