/**
 * @file RedlinerApp.cpp
 * @brief Implementation of RedlinerApp.
 */

#include "app/RedlinerApp.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include "application/ManifestWriter.hpp"
#include "application/OperationInterpreter.hpp"
#include "domain/Errors.hpp"
#include "domain/grammar/HeuristicGrammarAdvisor.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaGrammarAdvisor.hpp"
#include "infrastructure/OperationListReader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RasterImageProbe.hpp"
#include "infrastructure/wordml/WordMlReader.hpp"
#include "infrastructure/wordml/WordMlWriter.hpp"

namespace redliner::app {

std::string RedlinerApp::Usage() {
    return "Usage: redliner --in <document.xml> --ops <operations.json> --out <output.xml>\n"
           "                [--manifest <path>] [--config <settings.json>] [--logo <image>]\n"
           "                [--advisor none|heuristic|ollama] [--keep-highlighting]\n";
}

std::optional<CliOptions> RedlinerApp::ParseArgs(const std::vector<std::string>& args) {
    CliOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](std::string& target) {
            if (i + 1 >= args.size()) {
                std::cerr << "[RedlinerApp] Missing value for " << arg << std::endl;
                return false;
            }
            target = args[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--in") {
            ok = value(options.inputPath);
        } else if (arg == "--ops") {
            ok = value(options.operationsPath);
        } else if (arg == "--out") {
            ok = value(options.outputPath);
        } else if (arg == "--manifest") {
            ok = value(options.manifestPath);
        } else if (arg == "--config") {
            ok = value(options.configPath);
        } else if (arg == "--logo") {
            ok = value(options.logoPath);
        } else if (arg == "--advisor") {
            ok = value(options.advisor);
            if (ok && options.advisor != "none" && options.advisor != "heuristic" && options.advisor != "ollama") {
                std::cerr << "[RedlinerApp] Unknown advisor '" << options.advisor << "'" << std::endl;
                ok = false;
            }
        } else if (arg == "--keep-highlighting") {
            options.keepHighlighting = true;
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            return options;
        } else {
            std::cerr << "[RedlinerApp] Unknown argument: " << arg << std::endl;
            ok = false;
        }
        if (!ok) return std::nullopt;
    }

    if (options.inputPath.empty() || options.operationsPath.empty() || options.outputPath.empty()) {
        std::cerr << "[RedlinerApp] --in, --ops and --out are required." << std::endl;
        return std::nullopt;
    }
    return options;
}

RedlinerApp::RedlinerApp(CliOptions options) : m_options(std::move(options)) {}

application::AppServices RedlinerApp::Init(const infrastructure::EngineSettings& settings) const {
    application::AppServices services;
    services.advisorName = m_options.advisor.empty() ? settings.grammarAdvisor : m_options.advisor;

    if (services.advisorName == "ollama") {
        auto client = std::make_shared<infrastructure::OllamaClient>(settings.ollamaHost, settings.ollamaPort);
        services.grammarAdvisor = std::make_shared<infrastructure::OllamaGrammarAdvisor>(client, settings.ollamaModel);
        std::cout << "[RedlinerApp] Grammar advisor: Ollama " << settings.ollamaModel << " at " << settings.ollamaHost
                  << ":" << settings.ollamaPort << std::endl;
    } else if (services.advisorName == "heuristic") {
        services.grammarAdvisor = std::make_shared<domain::grammar::HeuristicGrammarAdvisor>();
    }

    services.imageProbe = std::make_shared<infrastructure::RasterImageProbe>();
    services.interpreterSettings.revisionAuthor = settings.defaultAuthor;
    services.interpreterSettings.defaultLogoHeightMm = settings.logoHeightMm;
    services.interpreterSettings.matchLimits.maxPatternLength = settings.patternMaxLength;
    services.interpreterSettings.matchLimits.maxMemory = settings.patternMaxMemory;
    return services;
}

int RedlinerApp::Run() {
    std::filesystem::path configPath = m_options.configPath.empty()
        ? infrastructure::PathUtils::GetDefaultSettingsPath()
        : std::filesystem::path(m_options.configPath);
    infrastructure::EngineSettings settings = infrastructure::ConfigLoader::LoadSettings(configPath);
    application::AppServices services = Init(settings);

    infrastructure::wordml::WordMlReader::Options readOptions;
    readOptions.cleanHighlighting = settings.cleanHighlighting && !m_options.keepHighlighting;

    infrastructure::wordml::LoadedDocument loaded;
    infrastructure::OperationList operations;
    try {
        loaded = infrastructure::wordml::WordMlReader(readOptions).loadFile(m_options.inputPath);
        operations = infrastructure::OperationListReader::ReadFile(m_options.operationsPath, m_options.logoPath);
    } catch (const domain::SerializationError& e) {
        std::cerr << "[RedlinerApp] " << e.what() << std::endl;
        return 2;
    }

    application::OperationInterpreter interpreter(std::move(loaded.document), services.grammarAdvisor,
                                                  services.imageProbe, services.interpreterSettings);
    application::ExecutionReport report = interpreter.run(operations.entries, [](std::string status) {
        std::cout << "[RedlinerApp] " << status << std::endl;
    });

    std::string manifestPath = m_options.manifestPath.empty()
        ? infrastructure::PathUtils::DefaultManifestPath(m_options.outputPath).string()
        : m_options.manifestPath;
    application::ManifestInfo info{m_options.inputPath, m_options.operationsPath, m_options.outputPath,
                                   services.advisorName};

    try {
        infrastructure::wordml::WordMlWriter writer(*loaded.package);
        std::string xml = writer.writeToString(interpreter.document());
        infrastructure::PersistenceService::SaveText(m_options.outputPath, xml);
    } catch (const domain::SerializationError& e) {
        std::cerr << "[RedlinerApp] Could not write " << m_options.outputPath << ": " << e.what() << std::endl;
        try {
            application::ManifestWriter::Save(manifestPath, report, info);
        } catch (const domain::SerializationError& manifestError) {
            std::cerr << "[RedlinerApp] " << manifestError.what() << std::endl;
        }
        return 2;
    }

    try {
        application::ManifestWriter::Save(manifestPath, report, info);
    } catch (const domain::SerializationError& e) {
        std::cerr << "[RedlinerApp] " << e.what() << std::endl;
        return 2;
    }

    std::cout << application::ManifestWriter::Summary(report);
    return report.count(application::OperationStatus::Failed) > 0 ? 1 : 0;
}

} // namespace redliner::app
