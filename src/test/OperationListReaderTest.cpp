#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OperationListReader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace redliner::domain;
using namespace redliner::infrastructure;
using json = nlohmann::json;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

void TestEnvelopeWithLogo(const std::filesystem::path& root) {
    std::cout << "[Test] Envelope layout with logo metadata..." << std::endl;
    WriteFile(root / "logo.png", "PNGDATA");
    json ops = json::parse(R"({
        "metadata": { "logo_path": "logo.png", "policy": "Access Control" },
        "instructions": { "operations": [
            { "target_text": "<owner>", "action": "replace", "replacement": "Jane Doe",
              "comment": "From questionnaire", "MatchCase": true },
            { "target_text": "Password Management System", "action": "delete", "skip_if_absent": true },
            { "target_text": "quarterly", "action": "comment", "comment": "Too often?" },
            { "target_text": "[Company Logo]", "action": "replace_with_logo", "width_mm": 30 },
            { "action": "smart_replace", "placeholder": "<24 business hours>",
              "user_response": "immediately", "context": "termination" },
            { "target_text": "cat", "action": "replace", "replacement": "dog", "whole_word": false,
              "whole_document": true, "wildcards": false }
        ] }
    })");
    WriteFile(root / "ops.json", ops.dump());

    OperationList list = OperationListReader::ReadFile(root / "ops.json");
    assert(list.entries.size() == 6);
    assert(list.logoPath == (root / "logo.png").string());

    const Operation& replace = *list.entries[0].operation;
    assert(std::get<ReplaceAction>(replace.action).replacement == "Jane Doe");
    assert(replace.comment == "From questionnaire");
    assert(replace.commentAuthor == "policy assistant");
    assert(replace.match.caseSensitive && replace.match.wholeWord && !replace.match.isPattern);

    const Operation& remove = *list.entries[1].operation;
    assert(std::holds_alternative<DeleteAction>(remove.action) && remove.skipIfAbsent);

    assert(std::holds_alternative<CommentAction>(list.entries[2].operation->action));

    const auto& logo = std::get<ReplaceWithImageAction>(list.entries[3].operation->action);
    assert(logo.imageBytes == std::vector<unsigned char>({'P', 'N', 'G', 'D', 'A', 'T', 'A'}));
    assert(logo.size.widthMm == 30.0 && logo.size.heightMm == 0.0);

    const Operation& smart = *list.entries[4].operation;
    assert(smart.target == "<24 business hours>");
    assert(std::get<ReplaceAction>(smart.action).replacement == "immediately");
    assert(smart.alwaysConsultGrammar);
    assert(list.entries[4].action == "smart_replace");

    const Operation& everywhere = *list.entries[5].operation;
    assert(!everywhere.match.wholeWord && everywhere.wholeDocument);
}

void TestBareArrayAndBadRecords() {
    std::cout << "[Test] Bare array with malformed records..." << std::endl;
    json ops = json::parse(R"([
        { "target_text": "x", "action": "rename" },
        { "action": "replace", "replacement": "y" },
        { "target_text": "x", "action": "replace", "replacement": 42 },
        "not an object",
        { "target_text": "<owner>", "action": "replace", "replacement": "", "comment_author": "legal" }
    ])");
    OperationList list = OperationListReader::Parse(ops, "");
    assert(list.entries.size() == 5);

    assert(!list.entries[0].operation && list.entries[0].error.find("rename") != std::string::npos);
    assert(!list.entries[1].operation && list.entries[1].error.find("target") != std::string::npos);
    assert(!list.entries[2].operation && list.entries[2].error.find("Malformed") != std::string::npos);
    assert(!list.entries[3].operation);

    // Empty replacements pass through; the interpreter reports them.
    const Operation& empty = *list.entries[4].operation;
    assert(std::get<ReplaceAction>(empty.action).replacement.empty());
    assert(empty.commentAuthor == "legal");
}

void TestSpreadsheetStyleFlags() {
    std::cout << "[Test] String flags from spreadsheet exports..." << std::endl;
    json ops = json::parse(R"([
        { "target_text": "a", "action": "delete", "MatchCase": "", "WholeWord": "", "Wildcards": "" },
        { "target_text": "b", "action": "delete", "MatchCase": "TRUE", "WholeWord": " no ", "Wildcards": "1" },
        { "target_text": "c", "action": "delete", "MatchCase": "Y", "ReplaceAll": "yes", "skip_if_absent": 0 },
        { "target_text": "d", "action": "delete", "WholeWord": "off", "skip_if_absent": 1 },
        { "target_text": "e", "action": "delete", "MatchCase": [true] }
    ])");
    OperationList list = OperationListReader::Parse(ops, "");
    assert(list.entries.size() == 5);

    const MatchOptions& blank = list.entries[0].operation->match;
    assert(!blank.caseSensitive && blank.wholeWord && !blank.isPattern);

    const MatchOptions& explicitFlags = list.entries[1].operation->match;
    assert(explicitFlags.caseSensitive && !explicitFlags.wholeWord && explicitFlags.isPattern);

    const Operation& yes = *list.entries[2].operation;
    assert(yes.match.caseSensitive && yes.wholeDocument && !yes.skipIfAbsent);

    const Operation& off = *list.entries[3].operation;
    assert(!off.match.wholeWord && off.skipIfAbsent);

    assert(!list.entries[4].operation && list.entries[4].error.find("Malformed") != std::string::npos);
}

void TestUnusableFiles(const std::filesystem::path& root) {
    std::cout << "[Test] Unusable operation files..." << std::endl;
    bool threw = false;
    try {
        OperationListReader::ReadFile(root / "missing.json");
    } catch (const SerializationError&) {
        threw = true;
    }
    assert(threw);

    WriteFile(root / "broken.json", "{ not json");
    threw = false;
    try {
        OperationListReader::ReadFile(root / "broken.json");
    } catch (const SerializationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        OperationListReader::Parse(json::parse(R"({"metadata": {}})"), "");
    } catch (const SerializationError&) {
        threw = true;
    }
    assert(threw);
}

void TestSettings(const std::filesystem::path& root) {
    std::cout << "[Test] Settings file..." << std::endl;
    EngineSettings defaults = ConfigLoader::LoadSettings(root / "no-settings.json");
    assert(defaults.defaultAuthor == "policy assistant");
    assert(defaults.grammarAdvisor == "heuristic");
    assert(defaults.cleanHighlighting);

    WriteFile(root / "settings.json", R"({
        "default_author": "Compliance Bot",
        "grammar_advisor": "telepathy",
        "ollama_port": 9000,
        "clean_highlighting": false,
        "logo_height_mm": -2,
        "pattern_max_length": "long"
    })");
    EngineSettings settings = ConfigLoader::LoadSettings(root / "settings.json");
    assert(settings.defaultAuthor == "Compliance Bot");
    assert(settings.grammarAdvisor == "heuristic");
    assert(settings.ollamaPort == 9000);
    assert(!settings.cleanHighlighting);
    assert(settings.logoHeightMm == 6.0);
    assert(settings.patternMaxLength == 512);

    WriteFile(root / "garbage.json", "[1, 2");
    EngineSettings fallback = ConfigLoader::LoadSettings(root / "garbage.json");
    assert(fallback.defaultAuthor == "policy assistant");

    assert(PathUtils::DefaultManifestPath("out/policy.xml").string() == "out/policy.xml.manifest.json");
    assert(PathUtils::GetDefaultSettingsPath().filename() == "settings.json");
}

} // namespace

int main() {
    std::cout << "[Test] Starting OperationListReader Test..." << std::endl;
    std::filesystem::path root = std::filesystem::temp_directory_path() / "redliner_ops_test";
    std::filesystem::create_directories(root);

    TestEnvelopeWithLogo(root);
    TestBareArrayAndBadRecords();
    TestSpreadsheetStyleFlags();
    TestUnusableFiles(root);
    TestSettings(root);

    std::filesystem::remove_all(root);
    std::cout << "[PASS] OperationListReader Test." << std::endl;
    return 0;
}
