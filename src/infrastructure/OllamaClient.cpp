#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>
#include <utility>

namespace redliner::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kTemperature = 0.0;
constexpr double kTopP = 1.0;
constexpr int kSeed = 42;
constexpr int kConnectTimeoutSeconds = 3;
}

OllamaClient::OllamaClient(std::string host, int port, int readTimeoutSeconds)
    : m_host(std::move(host)), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

json OllamaClient::BuildPayload(const CompletionRequest& request) {
    json payload = {
        {"model", request.model},
        {"prompt", request.prompt},
        {"stream", false},
        {"options", {
            {"temperature", kTemperature},
            {"top_p", kTopP},
            {"seed", kSeed},
            {"num_predict", request.maxTokens}
        }}
    };
    if (!request.system.empty()) payload["system"] = request.system;
    if (request.jsonReply) payload["format"] = "json";
    return payload;
}

std::optional<std::string> OllamaClient::ExtractResponse(const std::string& body) {
    try {
        auto reply = json::parse(body);
        if (reply.is_object() && reply.contains("response") && reply["response"].is_string()) {
            return reply["response"].get<std::string>();
        }
        std::cerr << "[OllamaClient] Reply has no 'response' text." << std::endl;
    } catch (const json::parse_error& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool OllamaClient::reachable() {
    if (m_reachable) return *m_reachable;

    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kConnectTimeoutSeconds);
    auto res = cli.Get("/api/version");
    m_reachable = res && res->status == 200;
    if (!*m_reachable) {
        std::cerr << "[OllamaClient] Server at " << m_host << ":" << m_port << " is not reachable." << std::endl;
    }
    return *m_reachable;
}

std::optional<std::string> OllamaClient::complete(const CompletionRequest& request) {
    if (!reachable()) return std::nullopt;

    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(m_readTimeoutSeconds);

    auto res = cli.Post("/api/generate", BuildPayload(request).dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }
    return ExtractResponse(res->body);
}

} // namespace redliner::infrastructure
