/**
 * @file RevisionWriter.hpp
 * @brief Records edits as tracked insertions and deletions.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/document/Document.hpp"
#include "domain/matching/Matcher.hpp"

namespace redliner::domain::revision {

/** @brief Source of revision timestamps (ISO 8601, UTC). Injected so tests can pin it. */
using RevisionClock = std::function<std::string()>;

/**
 * @struct RevisionResult
 * @brief What an edit produced.
 *
 * `deletion` is absent when the span only covered text inserted by an earlier
 * edit: such text is retracted instead of being marked deleted.
 */
struct RevisionResult {
    std::optional<RevisionTag> deletion;
    std::optional<RevisionTag> insertion;
    std::vector<RunId> deletedRuns;
    std::vector<RunId> retractedRuns;
    std::vector<RunId> insertedRuns;
};

/**
 * @class RevisionWriter
 * @brief Splits runs at span boundaries and tags them.
 *
 * Every method validates the span against the current model before touching
 * it. A rejected span throws std::invalid_argument and leaves the document as it
 * was.
 */
class RevisionWriter {
public:
    explicit RevisionWriter(RevisionClock clock = nullptr);

    RevisionResult applyReplace(Document& document,
                                const matching::MatchSpan& span,
                                const std::string& replacement,
                                const std::string& author);

    RevisionResult applyDelete(Document& document,
                               const matching::MatchSpan& span,
                               const std::string& author);

    /** @brief Tracked replace whose inserted run carries a picture instead of text. */
    RevisionResult applyImageReplace(Document& document,
                                     const matching::MatchSpan& span,
                                     const ImageRef& image,
                                     const std::string& author);

    /**
     * @brief Splits runs so the span is covered by whole runs.
     * @return First and last run positions of the isolated range.
     */
    std::pair<size_t, size_t> isolate(Document& document, const matching::MatchSpan& span);

    /** @brief Throws std::invalid_argument if the span does not fit the document. */
    void validate(const Document& document, const matching::MatchSpan& span) const;

    std::string timestamp() const { return m_clock(); }

    /** @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ". */
    static std::string UtcNow();

private:
    RevisionResult retractAndInsert(Document& document,
                                    const matching::MatchSpan& span,
                                    std::optional<Run> insertion,
                                    const std::string& author);

    RevisionClock m_clock;
};

} // namespace redliner::domain::revision
