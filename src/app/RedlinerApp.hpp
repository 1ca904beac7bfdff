/**
 * @file RedlinerApp.hpp
 * @brief Command-line front end of the revision engine.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace redliner::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    std::string inputPath;
    std::string operationsPath;
    std::string outputPath;
    std::string manifestPath;   ///< Empty: next to the output.
    std::string configPath;     ///< Empty: XDG default location.
    std::string logoPath;       ///< Overrides metadata.logo_path.
    std::string advisor;        ///< Overrides grammar_advisor from settings.
    bool keepHighlighting = false;
    bool showHelp = false;
};

/**
 * @class RedlinerApp
 * @brief Loads a document, applies an operation list and writes the redlined result.
 */
class RedlinerApp {
public:
    /**
     * @brief Parses argv.
     * @return nullopt (with a message on stderr) if the arguments are unusable.
     */
    static std::optional<CliOptions> ParseArgs(const std::vector<std::string>& args);

    static std::string Usage();

    explicit RedlinerApp(CliOptions options);

    /**
     * @brief Runs the whole pipeline.
     * @return Exit code: 0 when every operation applied or skipped, 1 when some
     * failed, 2 when the input could not be loaded or the output written.
     */
    int Run();

private:
    /** @brief Composition root: settings, advisor and image probe. */
    application::AppServices Init(const infrastructure::EngineSettings& settings) const;

    CliOptions m_options;
};

} // namespace redliner::app
