/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace redliner::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        target = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

EngineSettings ConfigLoader::LoadSettings(const std::filesystem::path& configPath) {
    EngineSettings settings;
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object; using defaults." << std::endl;
        return settings;
    }

    ReadKey(j, "default_author", settings.defaultAuthor);
    ReadKey(j, "grammar_advisor", settings.grammarAdvisor);
    ReadKey(j, "ollama_host", settings.ollamaHost);
    ReadKey(j, "ollama_port", settings.ollamaPort);
    ReadKey(j, "ollama_model", settings.ollamaModel);
    ReadKey(j, "clean_highlighting", settings.cleanHighlighting);
    ReadKey(j, "logo_height_mm", settings.logoHeightMm);
    ReadKey(j, "pattern_max_length", settings.patternMaxLength);
    ReadKey(j, "pattern_max_memory", settings.patternMaxMemory);

    if (settings.grammarAdvisor != "none" && settings.grammarAdvisor != "heuristic" && settings.grammarAdvisor != "ollama") {
        std::cerr << "[ConfigLoader] Unknown grammar_advisor '" << settings.grammarAdvisor
                  << "'; using heuristic." << std::endl;
        settings.grammarAdvisor = "heuristic";
    }
    if (settings.logoHeightMm <= 0.0) {
        std::cerr << "[ConfigLoader] logo_height_mm must be positive; using 6." << std::endl;
        settings.logoHeightMm = 6.0;
    }
    return settings;
}

} // namespace redliner::infrastructure
