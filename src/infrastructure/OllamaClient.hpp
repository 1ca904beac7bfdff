/**
 * @file OllamaClient.hpp
 * @brief Minimal HTTP client for the Ollama generate endpoint.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace redliner::infrastructure {

/**
 * @struct CompletionRequest
 * @brief One /api/generate call. Sampling is always pinned for repeatable answers.
 */
struct CompletionRequest {
    std::string model;
    std::string system;
    std::string prompt;
    bool jsonReply = false; ///< Ask the server to constrain output to JSON.
    int maxTokens = 256;
};

class OllamaClient {
public:
    OllamaClient(std::string host = "localhost", int port = 11434, int readTimeoutSeconds = 120);

    /** @return The model's text, or nullopt on any transport or protocol error. */
    std::optional<std::string> complete(const CompletionRequest& request);

    /**
     * @brief Probes /api/version once and remembers the answer.
     *
     * Lets a batch of operations stop calling an unreachable server after the
     * first refusal instead of waiting on each connection timeout.
     */
    bool reachable();

    static nlohmann::json BuildPayload(const CompletionRequest& request);

    /** @brief The "response" field of a non-streaming reply body. */
    static std::optional<std::string> ExtractResponse(const std::string& body);

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
    std::optional<bool> m_reachable;
};

} // namespace redliner::infrastructure
