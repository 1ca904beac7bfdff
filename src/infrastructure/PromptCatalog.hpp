/**
 * @file PromptCatalog.hpp
 * @brief Central storage for LLM system prompts.
 */

#pragma once

#include <string>

namespace redliner::infrastructure {

class PromptCatalog {
public:
    /** @brief System prompt for the grammar-compatibility check. Requests a JSON verdict. */
    static std::string GetGrammarCheckPrompt();

    /** @brief User prompt carrying one substitution to judge. */
    static std::string BuildGrammarCheckRequest(const std::string& target,
                                                const std::string& sentence,
                                                const std::string& replacement);
};

} // namespace redliner::infrastructure
