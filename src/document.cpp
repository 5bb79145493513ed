#include <docpatch-cpp/document.hpp>

namespace docpatch_cpp {

auto Document::create(Value content, const ContentHasher& hasher) -> Result<Document, Error> {
    if (!content.is_object()) {
        return fail(Error{ErrorKind::invalid_document,
                          "document content must be an object, got " +
                              std::string{to_string_view(content.type())}});
    }
    if (!all_numbers_finite(content)) {
        return fail(Error{ErrorKind::invalid_document,
                          "document content contains a non-finite number"});
    }
    auto hash = hasher.hash(content);
    return Document{std::move(content), 1, std::move(hash)};
}

auto verify_content_hash(const Document& document, const ContentHasher& hasher) -> bool {
    return hasher.hash(document.content) == document.content_hash;
}

}  // namespace docpatch_cpp
