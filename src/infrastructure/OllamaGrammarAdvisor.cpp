/**
 * @file OllamaGrammarAdvisor.cpp
 * @brief Implementation of OllamaGrammarAdvisor.
 */

#include "infrastructure/OllamaGrammarAdvisor.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/PromptCatalog.hpp"

namespace redliner::infrastructure {

using json = nlohmann::json;
using namespace redliner::domain::grammar;

OllamaGrammarAdvisor::OllamaGrammarAdvisor(std::shared_ptr<OllamaClient> client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

std::optional<GrammarVerdict> OllamaGrammarAdvisor::ParseVerdict(const std::string& reply) {
    json body;
    try {
        body = json::parse(reply);
    } catch (const json::parse_error& e) {
        std::cerr << "[OllamaGrammarAdvisor] Reply is not JSON: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!body.is_object() || !body.contains("verdict") || !body["verdict"].is_string()) {
        return std::nullopt;
    }

    std::string verdict = body["verdict"].get<std::string>();
    if (verdict == "narrow_ok") {
        return NarrowOk{};
    }
    if (verdict == "needs_sentence_rewrite") {
        if (!body.contains("rewritten_sentence") || !body["rewritten_sentence"].is_string()) {
            return std::nullopt;
        }
        std::string sentence = body["rewritten_sentence"].get<std::string>();
        if (sentence.empty()) return std::nullopt;
        return NeedsSentenceRewrite{sentence};
    }
    return std::nullopt;
}

GrammarVerdict OllamaGrammarAdvisor::classify(const GrammarRequest& request) {
    if (!m_client) return NarrowOk{};

    CompletionRequest completion;
    completion.model = m_model;
    completion.system = PromptCatalog::GetGrammarCheckPrompt();
    completion.prompt = PromptCatalog::BuildGrammarCheckRequest(request.target, request.sentence, request.replacement);
    completion.jsonReply = true;

    auto reply = m_client->complete(completion);
    if (!reply) {
        std::cerr << "[OllamaGrammarAdvisor] No reply from model; keeping narrow replacement." << std::endl;
        return NarrowOk{};
    }

    auto verdict = ParseVerdict(*reply);
    if (!verdict) {
        std::cerr << "[OllamaGrammarAdvisor] Unusable verdict; keeping narrow replacement." << std::endl;
        return NarrowOk{};
    }
    return *verdict;
}

} // namespace redliner::infrastructure
