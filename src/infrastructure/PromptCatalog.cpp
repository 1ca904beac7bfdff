#include "infrastructure/PromptCatalog.hpp"
#include <nlohmann/json.hpp>

namespace redliner::infrastructure {

std::string PromptCatalog::GetGrammarCheckPrompt() {
    return
        "You review template substitutions in policy documents.\n"
        "A placeholder inside a sentence is about to be replaced by a user's answer.\n"
        "Decide whether replacing ONLY the placeholder leaves a grammatical English sentence.\n\n"
        "RULES:\n"
        "1. If the sentence reads correctly with the answer in place of the placeholder, the verdict is \"narrow_ok\".\n"
        "2. Otherwise the verdict is \"needs_sentence_rewrite\" and you must write the full corrected sentence.\n"
        "   Example: \"Access will be terminated within <24 business hours>.\" with answer \"immediately\"\n"
        "   becomes \"Access will be terminated immediately.\"\n"
        "3. Keep the original meaning, wording and punctuation everywhere the answer does not force a change.\n"
        "4. Never invent content that is not in the sentence or the answer.\n\n"
        "OUTPUT: a single JSON object, nothing else:\n"
        "{\"verdict\": \"narrow_ok\" | \"needs_sentence_rewrite\", \"rewritten_sentence\": \"...\"}\n"
        "\"rewritten_sentence\" is required only for \"needs_sentence_rewrite\".";
}

std::string PromptCatalog::BuildGrammarCheckRequest(const std::string& target,
                                                    const std::string& sentence,
                                                    const std::string& replacement) {
    nlohmann::json request = {
        {"placeholder", target},
        {"sentence", sentence},
        {"answer", replacement}
    };
    return request.dump(2);
}

} // namespace redliner::infrastructure
