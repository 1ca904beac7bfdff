/**
 * @file CommentAttacher.cpp
 * @brief Implementation of CommentAttacher.
 */

#include "domain/revision/CommentAttacher.hpp"
#include <iostream>

namespace redliner::domain::revision {

namespace {
    bool IsBlank(const std::string& s) {
        return s.find_first_not_of(" \t\r\n") == std::string::npos;
    }
}

CommentAttacher::CommentAttacher(RevisionClock clock)
    : m_clock(clock ? std::move(clock) : RevisionClock(&RevisionWriter::UtcNow)) {}

std::optional<RevisionTag> CommentAttacher::AnchorFor(const RevisionResult& result) {
    if (result.deletion) return result.deletion;
    return result.insertion;
}

std::optional<RevisionThread> CommentAttacher::attach(Document& document,
                                                      const RevisionTag& tag,
                                                      const std::string& body,
                                                      const std::string& author) {
    if (IsBlank(body)) return std::nullopt;

    auto runs = document.runsWithRevision(tag.id);
    if (runs.empty()) {
        std::cerr << "[CommentAttacher] No runs carry revision " << tag.id << "; comment dropped." << std::endl;
        return std::nullopt;
    }

    // A revision is written into a single block.
    return createThread(document, runs.front().first, runs.front().second, runs.back().second,
                        body, author, tag.id);
}

std::optional<RevisionThread> CommentAttacher::attachToRuns(Document& document,
                                                            BlockId block,
                                                            RunId first,
                                                            RunId last,
                                                            const std::string& body,
                                                            const std::string& author) {
    if (IsBlank(body)) return std::nullopt;
    return createThread(document, block, first, last, body, author, std::nullopt);
}

std::optional<RevisionThread> CommentAttacher::createThread(Document& document,
                                                            BlockId block,
                                                            RunId first,
                                                            RunId last,
                                                            const std::string& body,
                                                            const std::string& author,
                                                            std::optional<RevisionId> revision) {
    if (!document.block(block).supportsComments()) {
        std::cerr << "[CommentAttacher] " << ContainerKindToString(document.block(block).container)
                  << " blocks cannot hold comments; comment dropped." << std::endl;
        return std::nullopt;
    }

    RevisionThread thread;
    thread.commentId = document.nextCommentId();
    thread.block = block;
    thread.anchorFirst = first;
    thread.anchorLast = last;
    thread.revision = revision;
    thread.author = author;
    thread.body = body;
    thread.timestamp = m_clock();
    return document.addThread(std::move(thread));
}

} // namespace redliner::domain::revision
