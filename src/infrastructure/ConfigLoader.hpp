/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading engine configuration (settings.json).
 * 
 * Keeps JSON parsing of the settings file in one place. Every key is optional;
 * a missing or malformed file yields the defaults below.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace redliner::infrastructure {

/**
 * @struct EngineSettings
 * @brief Values read from settings.json, with their defaults.
 */
struct EngineSettings {
    std::string defaultAuthor = "policy assistant"; ///< Author of tracked revisions.
    std::string grammarAdvisor = "heuristic";       ///< "none", "heuristic" or "ollama".
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "llama3";
    bool cleanHighlighting = true;
    double logoHeightMm = 6.0;
    std::size_t patternMaxLength = 512;
    std::int64_t patternMaxMemory = 1 << 20;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param configPath Path to the file. A missing file is not an error.
     * @return EngineSettings Defaults overridden by the keys present in the file.
     */
    static EngineSettings LoadSettings(const std::filesystem::path& configPath);
};

} // namespace redliner::infrastructure
