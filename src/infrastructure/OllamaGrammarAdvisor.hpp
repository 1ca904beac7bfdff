/**
 * @file OllamaGrammarAdvisor.hpp
 * @brief Grammar oracle backed by a local Ollama model.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/grammar/GrammarAdvisor.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace redliner::infrastructure {

/**
 * @class OllamaGrammarAdvisor
 * @brief Asks the model for a JSON verdict.
 *
 * Sampling is pinned (temperature 0, fixed seed) so a given request yields the
 * same verdict. Any transport or parse failure degrades to NarrowOk.
 */
class OllamaGrammarAdvisor : public domain::grammar::GrammarAdvisor {
public:
    OllamaGrammarAdvisor(std::shared_ptr<OllamaClient> client, std::string model);

    domain::grammar::GrammarVerdict classify(const domain::grammar::GrammarRequest& request) override;

    /** @brief Parses the model's reply. nullopt if it is not a well-formed verdict. */
    static std::optional<domain::grammar::GrammarVerdict> ParseVerdict(const std::string& reply);

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
};

} // namespace redliner::infrastructure
