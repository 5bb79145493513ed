/// @file document.hpp
/// @brief A versioned document snapshot: content, version and content hash.

#pragma once

#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/hasher.hpp>
#include <docpatch-cpp/result.hpp>
#include <docpatch-cpp/value.hpp>

#include <cstdint>
#include <string>

namespace docpatch_cpp {

/// One immutable-by-convention snapshot of a document.
///
/// `content_hash` is the hash of `content` as computed by the hasher the
/// document was created with. `version` starts at 1 and grows by exactly
/// one per committed patch.
struct Document {
    Value content;
    std::int64_t version{1};
    std::string content_hash;

    /// Make version 1 of a document. The content must be an object and
    /// every number in it finite.
    static auto create(Value content, const ContentHasher& hasher) -> Result<Document, Error>;

    auto operator==(const Document&) const -> bool = default;
};

/// Recompute the hash of `document.content` and compare it to the stored one.
auto verify_content_hash(const Document& document, const ContentHasher& hasher) -> bool;

}  // namespace docpatch_cpp
