/// @file hasher.hpp
/// @brief Canonical serialization and content hashing of value trees.

#pragma once

#include <docpatch-cpp/options.hpp>
#include <docpatch-cpp/pointer.hpp>
#include <docpatch-cpp/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace docpatch_cpp {

/// Canonical JSON text of a value.
///
/// Object keys are sorted bytewise, there is no whitespace, integers are
/// written in decimal and doubles in shortest round-trip form (an integral
/// double is written without a fraction, so `1` and `1.0` serialize alike,
/// matching Value equality). Strings use minimal JSON escaping; non-ASCII
/// bytes are written through unchanged.
///
/// Throws std::domain_error for a non-finite double.
auto canonical_json(const Value& value) -> std::string;

/// True if `text` is "sha256:" followed by 64 lowercase hex characters.
auto is_content_hash(std::string_view text) -> bool;

/// Computes "sha256:<hex>" digests over canonical JSON.
///
/// A hasher can be told to leave regions of the tree out of the digest.
/// Documents use this to keep their own audit log and stored hashes out of
/// the hash that those records describe.
///
/// @code
/// auto h = ContentHasher{};
/// auto digest = h.hash(Value{Object{{"field", 1}}});
/// @endcode
class ContentHasher {
public:
    /// Hashes whole trees.
    ContentHasher() = default;

    /// Hashes trees with the given regions removed first.
    explicit ContentHasher(std::vector<Pointer> excluded);

    /// The hasher documents are checked with: the audit log, the
    /// versioning metadata and the updated_at timestamp are excluded.
    static auto for_documents(const EngineOptions& options) -> ContentHasher;

    auto hash(const Value& tree) const -> std::string;

    auto excluded() const -> const std::vector<Pointer>& { return excluded_; }

private:
    std::vector<Pointer> excluded_;
};

}  // namespace docpatch_cpp
