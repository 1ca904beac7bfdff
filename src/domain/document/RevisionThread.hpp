/**
 * @file RevisionThread.hpp
 * @brief Comment anchored to a range of runs.
 */

#pragma once

#include <optional>
#include <string>
#include "Run.hpp"

namespace redliner::domain {

/**
 * @struct RevisionThread
 * @brief A reviewer-facing comment.
 *
 * Holds ids only. The Document owns both the thread and the runs it points at.
 */
struct RevisionThread {
    int commentId = 0;
    BlockId block = 0;
    RunId anchorFirst = 0;
    RunId anchorLast = 0;
    std::optional<RevisionId> revision; ///< Revision the thread explains, if any.
    std::string author;
    std::string body;
    std::string timestamp;
};

} // namespace redliner::domain
