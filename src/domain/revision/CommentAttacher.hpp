/**
 * @file CommentAttacher.hpp
 * @brief Binds reviewer comments to revisions or matched text.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/document/Document.hpp"
#include "domain/revision/RevisionWriter.hpp"

namespace redliner::domain::revision {

/**
 * @class CommentAttacher
 * @brief Creates RevisionThreads owned by the Document.
 *
 * An empty body never produces a thread. Blocks in header or footer stories
 * cannot carry comments; attaching there returns nullopt with a warning.
 */
class CommentAttacher {
public:
    explicit CommentAttacher(RevisionClock clock = nullptr);

    /** @brief Anchors a thread on the runs tagged with `tag`. */
    std::optional<RevisionThread> attach(Document& document,
                                         const RevisionTag& tag,
                                         const std::string& body,
                                         const std::string& author);

    /** @brief Anchors a thread on a contiguous range of runs, for comment-only edits. */
    std::optional<RevisionThread> attachToRuns(Document& document,
                                               BlockId block,
                                               RunId first,
                                               RunId last,
                                               const std::string& body,
                                               const std::string& author);

    /**
     * @brief Picks the revision a replace's comment belongs to: the deletion half,
     * or the insertion when the edit only retracted earlier inserted text.
     */
    static std::optional<RevisionTag> AnchorFor(const RevisionResult& result);

private:
    std::optional<RevisionThread> createThread(Document& document,
                                               BlockId block,
                                               RunId first,
                                               RunId last,
                                               const std::string& body,
                                               const std::string& author,
                                               std::optional<RevisionId> revision);

    RevisionClock m_clock;
};

} // namespace redliner::domain::revision
