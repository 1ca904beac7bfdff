/**
 * @file GrammarAdvisor.hpp
 * @brief Interface for deciding whether a placeholder can be substituted in place.
 */

#pragma once

#include <string>
#include <variant>

namespace redliner::domain::grammar {

/**
 * @struct GrammarRequest
 * @brief A candidate substitution and the sentence it lands in.
 */
struct GrammarRequest {
    std::string target;      ///< Text about to be replaced, e.g. "<24 business hours>".
    std::string sentence;    ///< Sentence containing the target, as currently shown.
    std::string replacement; ///< Proposed substitute.
};

/** @brief Replacing only the target keeps the sentence grammatical. */
struct NarrowOk {};

/** @brief The whole sentence must be replaced by `rewrittenSentence`. */
struct NeedsSentenceRewrite {
    std::string rewrittenSentence;
};

using GrammarVerdict = std::variant<NarrowOk, NeedsSentenceRewrite>;

/**
 * @class GrammarAdvisor
 * @brief Grammar-compatibility oracle consulted by the interpreter.
 *
 * Implementations must be deterministic for a given request; the interpreter
 * relies on that for reproducible output.
 */
class GrammarAdvisor {
public:
    virtual ~GrammarAdvisor() = default;

    virtual GrammarVerdict classify(const GrammarRequest& request) = 0;
};

} // namespace redliner::domain::grammar
