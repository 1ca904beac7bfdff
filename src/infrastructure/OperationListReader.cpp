/**
 * @file OperationListReader.cpp
 * @brief Implementation of OperationListReader.
 */

#include "infrastructure/OperationListReader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include "domain/Errors.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace redliner::infrastructure {

using namespace redliner::domain;

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

/** @brief First present key among aliases. Throws nlohmann type errors on a wrong type. */
template <typename T>
bool ReadAny(const nlohmann::json& j, std::initializer_list<const char*> keys, T& target) {
    for (const char* key : keys) {
        if (j.contains(key) && !j[key].is_null()) {
            target = j[key].get<T>();
            return true;
        }
    }
    return false;
}

/**
 * @brief Flag that may be a JSON boolean, a number or a spreadsheet-style string.
 *
 * Strings count as true for "1", "true", "yes" and "y" (any case). An empty
 * string leaves the default in place. Other JSON types are a type error.
 */
bool ReadFlag(const nlohmann::json& j, std::initializer_list<const char*> keys, bool& target) {
    for (const char* key : keys) {
        if (!j.contains(key) || j[key].is_null()) continue;
        const auto& value = j[key];
        if (value.is_boolean()) {
            target = value.get<bool>();
        } else if (value.is_number()) {
            target = value.get<double>() != 0.0;
        } else if (value.is_string()) {
            std::string text = Lower(value.get<std::string>());
            text.erase(std::remove_if(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); }),
                       text.end());
            if (text.empty()) return false;
            target = text == "1" || text == "true" || text == "yes" || text == "y";
        } else {
            target = value.get<bool>();
        }
        return true;
    }
    return false;
}

} // namespace

OperationList OperationListReader::ReadFile(const std::filesystem::path& path, const std::string& logoOverride) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw SerializationError("Cannot open operation list " + path.string());
    }
    nlohmann::json root;
    try {
        f >> root;
    } catch (const nlohmann::json::parse_error& e) {
        throw SerializationError("Operation list " + path.string() + " is not valid JSON: " + e.what());
    }
    return Parse(root, path.parent_path(), logoOverride);
}

OperationList OperationListReader::Parse(const nlohmann::json& root,
                                         const std::filesystem::path& baseDirectory,
                                         const std::string& logoOverride) {
    OperationList list;
    const nlohmann::json* records = nullptr;

    if (root.is_array()) {
        records = &root;
    } else if (root.is_object()) {
        if (root.contains("metadata") && root["metadata"].is_object()) {
            const auto& metadata = root["metadata"];
            if (metadata.contains("logo_path") && metadata["logo_path"].is_string()) {
                list.logoPath = metadata["logo_path"].get<std::string>();
            }
        }
        if (root.contains("instructions") && root["instructions"].is_object() &&
            root["instructions"].contains("operations") && root["instructions"]["operations"].is_array()) {
            records = &root["instructions"]["operations"];
        } else if (root.contains("operations") && root["operations"].is_array()) {
            records = &root["operations"];
        }
    }
    if (!records) {
        throw SerializationError("Operation list must be an array or contain instructions.operations.");
    }

    if (!logoOverride.empty()) list.logoPath = logoOverride;
    if (!list.logoPath.empty()) {
        std::filesystem::path logo = list.logoPath;
        if (logo.is_relative() && !baseDirectory.empty()) logo = baseDirectory / logo;
        list.logoPath = logo.string();
    }

    bool needsLogo = false;
    for (const auto& record : *records) {
        if (record.is_object() && record.contains("action") && record["action"].is_string() &&
            Lower(record["action"].get<std::string>()) == "replace_with_logo") {
            needsLogo = true;
            break;
        }
    }

    std::vector<unsigned char> logoBytes;
    if (needsLogo) {
        if (list.logoPath.empty()) {
            std::cerr << "[OperationListReader] replace_with_logo records present but no logo path given." << std::endl;
        } else {
            try {
                logoBytes = PersistenceService::ReadBytes(list.logoPath);
            } catch (const SerializationError& e) {
                // Image operations then fail on their own; the rest of the batch is unaffected.
                std::cerr << "[OperationListReader] " << e.what() << std::endl;
            }
        }
    }

    for (const auto& record : *records) {
        list.entries.push_back(ParseRecord(record, logoBytes));
    }
    std::cout << "[OperationListReader] Loaded " << list.entries.size() << " operation(s)." << std::endl;
    return list;
}

OperationEntry OperationListReader::ParseRecord(const nlohmann::json& record,
                                                const std::vector<unsigned char>& logoBytes) {
    OperationEntry entry;
    if (!record.is_object()) {
        entry.error = "Operation record is not a JSON object.";
        return entry;
    }

    try {
        std::string action;
        ReadAny(record, {"action"}, action);
        action = Lower(action);
        entry.action = action;

        Operation op;
        std::string target;
        if (action == "smart_replace") {
            ReadAny(record, {"placeholder", "target_text"}, target);
            std::string response;
            ReadAny(record, {"user_response", "replacement"}, response);
            op.action = ReplaceAction{response};
            op.alwaysConsultGrammar = true;
        } else {
            ReadAny(record, {"target_text", "target"}, target);
            if (action == "replace") {
                std::string replacement;
                ReadAny(record, {"replacement"}, replacement);
                op.action = ReplaceAction{replacement};
            } else if (action == "delete") {
                op.action = DeleteAction{};
            } else if (action == "comment") {
                op.action = CommentAction{};
            } else if (action == "replace_with_logo") {
                ReplaceWithImageAction image;
                image.imageBytes = logoBytes;
                ReadAny(record, {"image_name"}, image.imageName);
                ReadAny(record, {"width_mm"}, image.size.widthMm);
                ReadAny(record, {"height_mm"}, image.size.heightMm);
                op.action = std::move(image);
            } else {
                entry.target = target;
                entry.error = action.empty() ? "Operation record has no action." : "Unknown action '" + action + "'.";
                return entry;
            }
        }
        entry.target = target;
        if (IsBlank(target)) {
            entry.error = "Operation record has no target text.";
            return entry;
        }

        op.target = target;
        ReadAny(record, {"comment"}, op.comment);
        ReadAny(record, {"comment_author"}, op.commentAuthor);
        ReadFlag(record, {"MatchCase", "match_case"}, op.match.caseSensitive);
        ReadFlag(record, {"WholeWord", "whole_word"}, op.match.wholeWord);
        ReadFlag(record, {"Wildcards", "wildcards", "is_pattern"}, op.match.isPattern);
        ReadFlag(record, {"whole_document", "ReplaceAll", "replace_all"}, op.wholeDocument);
        ReadFlag(record, {"skip_if_absent"}, op.skipIfAbsent);
        ReadFlag(record, {"consult_grammar"}, op.alwaysConsultGrammar);
        if (op.commentAuthor.empty()) op.commentAuthor = "policy assistant";

        entry.operation = std::move(op);
    } catch (const nlohmann::json::exception& e) {
        entry.error = std::string("Malformed operation record: ") + e.what();
    }
    return entry;
}

} // namespace redliner::infrastructure
