#include <docpatch-cpp/engine.hpp>

#include <docpatch-cpp/applier.hpp>
#include <docpatch-cpp/inverse.hpp>
#include <docpatch-cpp/version_guard.hpp>

#include "timestamp.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <utility>

namespace docpatch_cpp {

namespace {

auto checked(EngineOptions options) -> EngineOptions {
    validate_options(options);
    return options;
}

// Tag the messages of a failed batch with its position.
auto in_batch(PatchError error, std::size_t batch) -> PatchError {
    const auto tag = "batch " + std::to_string(batch) + ": ";
    std::visit(overload{
        [&](PatchValidationError& e) {
            for (auto& message : e.errors) message.insert(0, tag);
        },
        [](OptimisticLockError&) {},
        [&](InverseGenerationError& e) { e.reason.insert(0, tag); },
        [&](PatchApplicationError& e) { e.reason.insert(0, tag); },
        [&](InvalidDocumentError& e) { e.reason.insert(0, tag); },
    }, error);
    return error;
}

}  // anonymous namespace

PatchEngine::PatchEngine() : PatchEngine(EngineOptions{}) {}

PatchEngine::PatchEngine(EngineOptions options)
    : options_{checked(std::move(options))},
      log_{options_.log_level, options_.log_sink},
      hasher_{ContentHasher::for_documents(options_)},
      validator_{options_},
      recorder_{options_} {}

auto PatchEngine::create_document(Value content) const -> Result<Document, Error> {
    auto document = Document::create(std::move(content), hasher_);
    if (document) {
        log_.debug("created document " + document->content_hash);
    }
    return document;
}

auto PatchEngine::verify(const Document& document) const -> bool {
    return verify_content_hash(document, hasher_);
}

auto PatchEngine::validate(const Patch& patch, const Document& document) const
    -> ValidationResult {
    return validator_.validate(patch, document);
}

auto PatchEngine::apply(const Document& document, const PatchRequest& request) const
    -> Result<PatchOutcome, PatchError> {
    const auto& patch = request.patch;
    log_.trace("patch request: " + std::to_string(patch.size()) + " operations against version " +
               std::to_string(document.version));

    if (auto lock = check_version(document.version, request.document_version); !lock) {
        return reject(std::move(lock).error());
    }
    log_.trace("version checked");

    if (auto checked_doc = check_document(document); !checked_doc) {
        return reject(std::move(checked_doc).error());
    }
    log_.trace("document checked");

    if (auto validation = validator_.validate(patch, document); !validation.is_valid) {
        return reject(PatchValidationError{std::move(validation.errors)});
    }
    log_.trace("validated");

    auto inverse = compute_inverse(patch, document.content);
    if (!inverse) return reject(std::move(inverse).error());
    log_.trace("inverse computed: " + std::to_string(inverse->size()) + " operations");

    auto content = apply_patch(patch, document.content);
    if (!content) return reject(std::move(content).error());
    // The validator has already checked the shape of every recorded region.
    if (auto prepared = recorder_.prepare(*content); !prepared) {
        throw std::logic_error{"validated content cannot take audit metadata: " +
                               std::move(prepared).error()};
    }
    log_.trace("applied");

    auto hash = hasher_.hash(*content);
    log_.trace("hashed: " + hash);

    auto result = PatchResult{};
    result.content_hash = hash;
    result.inverse_patch = *std::move(inverse);
    result.applied_at = now();

    if (request.dry_run) {
        result.new_version = document.version;
        result.dry_run = true;
        log_.debug("dry run against version " + std::to_string(document.version) +
                   " would produce " + hash);
        return PatchOutcome{document, std::move(result)};
    }

    result.new_version = document.version + 1;
    const auto entry = recorder_.make_entry(patch, request.actor, request.evidence,
                                            result.applied_at, result.new_version, hash,
                                            document.content_hash);
    if (auto recorded = recorder_.record(*content, entry); !recorded) {
        throw std::logic_error{"prepared content cannot take audit metadata: " +
                               std::move(recorded).error()};
    }
    log_.trace("audited");

    log_.info("committed version " + std::to_string(result.new_version) + " (" +
              std::to_string(patch.size()) + " operations, " + hash + ")");
    return PatchOutcome{Document{*std::move(content), result.new_version, std::move(hash)},
                        std::move(result)};
}

auto PatchEngine::apply_in_place(Document& document, const PatchRequest& request) const
    -> Result<PatchResult, PatchError> {
    auto outcome = apply(document, request);
    if (!outcome) return fail(std::move(outcome).error());
    if (!request.dry_run) document = std::move(outcome->document);
    return std::move(outcome->result);
}

auto PatchEngine::apply_batches(const Document& document,
                                std::int64_t expected_version,
                                const std::vector<Patch>& batches,
                                std::optional<std::string> actor,
                                std::vector<std::string> evidence) const
    -> Result<BatchOutcome, PatchError> {
    if (auto lock = check_version(document.version, expected_version); !lock) {
        return reject(std::move(lock).error());
    }
    if (auto checked_doc = check_document(document); !checked_doc) {
        return reject(std::move(checked_doc).error());
    }

    auto oversized = std::vector<std::string>{};
    for (std::size_t i = 0; i < batches.size(); ++i) {
        if (batches[i].size() > validator_.max_operations()) {
            oversized.push_back("batch " + std::to_string(i) + ": patch has " +
                                std::to_string(batches[i].size()) + " operations, the limit is " +
                                std::to_string(validator_.max_operations()));
        }
    }
    if (!oversized.empty()) return reject(PatchValidationError{std::move(oversized)});

    auto current = document;
    auto inverses = std::vector<Patch>{};
    inverses.reserve(batches.size());
    for (std::size_t i = 0; i < batches.size(); ++i) {
        auto request = PatchRequest{};
        request.document_version = current.version;
        request.patch = batches[i];
        request.evidence = evidence;
        request.actor = actor;

        auto outcome = apply(current, request);
        if (!outcome) return fail(in_batch(std::move(outcome).error(), i));
        current = std::move(outcome->document);
        inverses.push_back(std::move(outcome->result.inverse_patch));
    }
    std::ranges::reverse(inverses);

    log_.info("committed " + std::to_string(batches.size()) + " batches, now at version " +
              std::to_string(current.version));
    return BatchOutcome{std::move(current), std::move(inverses)};
}

auto PatchEngine::audit_log(const Document& document) const
    -> Result<std::vector<AuditEntry>, std::string> {
    return read_audit_log(document, options_);
}

auto PatchEngine::verify_audit_chain(const Document& document) const -> AuditChainReport {
    return docpatch_cpp::verify_audit_chain(document, options_);
}

auto PatchEngine::check_document(const Document& document) const
    -> Result<void, PatchError> {
    if (document.version == std::numeric_limits<std::int64_t>::max()) {
        return fail(PatchError{InvalidDocumentError{
            "version " + std::to_string(document.version) + " cannot be incremented"}});
    }
    if (!all_numbers_finite(document.content)) {
        return fail(PatchError{InvalidDocumentError{"content contains a non-finite number"}});
    }
    if (!verify(document)) {
        return fail(PatchError{InvalidDocumentError{
            "stored content_hash does not match the content"}});
    }
    return {};
}

auto PatchEngine::reject(PatchError error) const -> Failure<PatchError> {
    log_.warn("patch rejected: " + describe(error));
    return fail(std::move(error));
}

auto PatchEngine::now() const -> std::string {
    const auto tp = options_.clock ? options_.clock() : std::chrono::system_clock::now();
    return detail::format_timestamp(tp);
}

}  // namespace docpatch_cpp
