/**
 * @file OperationInterpreter.hpp
 * @brief Applies an ordered operation list to one document.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "application/ImageSubstitutor.hpp"
#include "domain/ImageProbe.hpp"
#include "domain/Operation.hpp"
#include "domain/document/Document.hpp"
#include "domain/grammar/GrammarAdvisor.hpp"
#include "domain/matching/Matcher.hpp"
#include "domain/revision/CommentAttacher.hpp"
#include "domain/revision/RevisionWriter.hpp"

namespace redliner::application {

enum class OperationStatus {
    Applied,
    Skipped,
    Failed
};

enum class FailureReason {
    None,
    TargetNotFound,
    InvalidOperation,
    PatternRejected,
    ImageDecodeFailed,
    InternalError   ///< A collaborator or the model threw something unexpected.
};

inline std::string OperationStatusToString(OperationStatus status) {
    switch (status) {
        case OperationStatus::Applied: return "applied";
        case OperationStatus::Skipped: return "skipped";
        case OperationStatus::Failed: return "failed";
        default: return "unknown";
    }
}

inline std::string FailureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::None: return "none";
        case FailureReason::TargetNotFound: return "target_not_found";
        case FailureReason::InvalidOperation: return "invalid_operation";
        case FailureReason::PatternRejected: return "pattern_rejected";
        case FailureReason::ImageDecodeFailed: return "image_decode_failed";
        case FailureReason::InternalError: return "internal_error";
        default: return "unknown";
    }
}

/**
 * @struct OperationOutcome
 * @brief Terminal state of one operation, as listed in the manifest.
 */
struct OperationOutcome {
    size_t index = 0;
    std::string target;
    std::string action;
    OperationStatus status = OperationStatus::Failed;
    FailureReason reason = FailureReason::None;
    std::string message;
    size_t occurrences = 0;
    bool widened = false;  ///< The containing sentence was replaced instead of the target.
    std::vector<domain::RevisionId> revisions;
    std::vector<int> commentIds;
};

/**
 * @struct ExecutionReport
 * @brief Outcomes of a whole run, in list order.
 */
struct ExecutionReport {
    std::vector<OperationOutcome> outcomes;

    size_t count(OperationStatus status) const {
        size_t n = 0;
        for (const auto& o : outcomes) {
            if (o.status == status) ++n;
        }
        return n;
    }
};

/**
 * @class OperationInterpreter
 * @brief Owns a document for one session and drives matching and revision writing.
 *
 * Operations run strictly in list order. Each one moves from resolving to
 * applied, skipped or failed. A failed operation leaves the document as it was
 * and never stops the batch.
 */
class OperationInterpreter {
public:
    struct Settings {
        std::string revisionAuthor = "policy assistant";
        double defaultLogoHeightMm = 6.0;
        domain::matching::Matcher::Limits matchLimits;
    };

    /**
     * @param document Document to edit. Ownership moves to the interpreter.
     * @param advisor Grammar oracle for placeholder targets. May be null (always narrow).
     * @param probe Raster decoder used by image substitutions.
     * @param clock Revision timestamp source. Null uses the system clock.
     */
    OperationInterpreter(std::unique_ptr<domain::Document> document,
                         std::shared_ptr<domain::grammar::GrammarAdvisor> advisor,
                         std::shared_ptr<domain::ImageProbe> probe,
                         Settings settings,
                         domain::revision::RevisionClock clock = nullptr);

    OperationInterpreter(const OperationInterpreter&) = delete;
    OperationInterpreter& operator=(const OperationInterpreter&) = delete;

    /**
     * @brief Applies every entry in order.
     * @param statusCallback Progress feedback, one line per operation.
     */
    ExecutionReport run(const std::vector<domain::OperationEntry>& entries,
                        std::function<void(std::string)> statusCallback = nullptr);

    /** @brief Applies a single operation. `index` is only used for reporting. */
    OperationOutcome apply(size_t index, const domain::Operation& operation);

    const domain::Document& document() const { return *m_document; }

    /** @brief Ends the session and hands the edited document to the caller. */
    std::unique_ptr<domain::Document> releaseDocument();

    /** @brief `<...>`, `[...]` or `{...}`: a template slot awaiting an answer. */
    static bool IsPlaceholder(const std::string& target);

private:
    void validate(const domain::Operation& operation) const;

    /** @brief Applies the operation at one match and returns where the search resumes. */
    domain::matching::SearchCursor applyAt(const domain::Operation& operation,
                                           const domain::matching::MatchSpan& span,
                                           const PreparedImage* image,
                                           OperationOutcome& outcome);

    /** @brief Asks the advisor and, on a rewrite verdict, re-resolves the sentence. */
    bool widenIfNeeded(const domain::Operation& operation,
                       domain::matching::MatchSpan& span,
                       std::string& replacement);

    void annotate(const domain::Operation& operation,
                  const domain::revision::RevisionResult& result,
                  OperationOutcome& outcome);

    std::unique_ptr<domain::Document> m_document;
    std::shared_ptr<domain::grammar::GrammarAdvisor> m_advisor;
    Settings m_settings;
    domain::matching::Matcher m_matcher;
    domain::revision::RevisionWriter m_writer;
    domain::revision::CommentAttacher m_comments;
    ImageSubstitutor m_images;
};

} // namespace redliner::application
