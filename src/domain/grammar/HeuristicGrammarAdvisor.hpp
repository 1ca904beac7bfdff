/**
 * @file HeuristicGrammarAdvisor.hpp
 * @brief Offline rule-based grammar oracle.
 */

#pragma once

#include "domain/grammar/GrammarAdvisor.hpp"

namespace redliner::domain::grammar {

/**
 * @class HeuristicGrammarAdvisor
 * @brief Two rules, both English-only:
 *
 * - Immediacy answers ("immediately", "ASAP"...) placed in a duration clause
 *   ("within <x>", "in <x>") drop the clause: the sentence is rebuilt as the
 *   text before "within"/"in" followed by the answer.
 * - "a <x>" followed by a vowel-initial answer becomes "an <answer>".
 *
 * Everything else is NarrowOk.
 */
class HeuristicGrammarAdvisor : public GrammarAdvisor {
public:
    GrammarVerdict classify(const GrammarRequest& request) override;

    /** @brief True if the answer expresses "now" rather than a duration. */
    static bool IsImmediacy(const std::string& response);
};

} // namespace redliner::domain::grammar
