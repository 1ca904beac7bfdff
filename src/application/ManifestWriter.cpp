/**
 * @file ManifestWriter.cpp
 * @brief Implementation of ManifestWriter.
 */

#include "application/ManifestWriter.hpp"
#include <sstream>
#include "infrastructure/PersistenceService.hpp"

namespace redliner::application {

nlohmann::json ManifestWriter::ToJson(const ExecutionReport& report, const ManifestInfo& info) {
    nlohmann::json j;
    j["input"] = info.input;
    j["operations_file"] = info.operations;
    j["output"] = info.output;
    j["grammar_advisor"] = info.advisor;
    j["summary"] = {
        {"total", report.outcomes.size()},
        {"applied", report.count(OperationStatus::Applied)},
        {"skipped", report.count(OperationStatus::Skipped)},
        {"failed", report.count(OperationStatus::Failed)}
    };

    nlohmann::json operations = nlohmann::json::array();
    for (const auto& outcome : report.outcomes) {
        nlohmann::json entry;
        entry["index"] = outcome.index;
        entry["target"] = outcome.target;
        entry["action"] = outcome.action;
        entry["outcome"] = OperationStatusToString(outcome.status);
        if (outcome.reason != FailureReason::None) entry["reason"] = FailureReasonToString(outcome.reason);
        if (!outcome.message.empty()) entry["message"] = outcome.message;
        entry["occurrences"] = outcome.occurrences;
        if (outcome.widened) entry["widened_to_sentence"] = true;
        if (!outcome.revisions.empty()) entry["revision_ids"] = outcome.revisions;
        if (!outcome.commentIds.empty()) entry["comment_ids"] = outcome.commentIds;
        operations.push_back(std::move(entry));
    }
    j["operations"] = std::move(operations);
    return j;
}

void ManifestWriter::Save(const std::string& path, const ExecutionReport& report, const ManifestInfo& info) {
    infrastructure::PersistenceService::SaveText(path, ToJson(report, info).dump(2) + "\n");
}

std::string ManifestWriter::Summary(const ExecutionReport& report) {
    std::ostringstream out;
    for (const auto& outcome : report.outcomes) {
        out << "  #" << outcome.index << " [" << OperationStatusToString(outcome.status) << "] " << outcome.action
            << " '" << outcome.target << "'";
        if (outcome.occurrences > 1) out << " x" << outcome.occurrences;
        if (outcome.widened) out << " (sentence rewritten)";
        if (!outcome.message.empty() && outcome.status != OperationStatus::Applied) out << ": " << outcome.message;
        out << "\n";
    }
    out << "Applied: " << report.count(OperationStatus::Applied) << "  Skipped: "
        << report.count(OperationStatus::Skipped) << "  Failed: " << report.count(OperationStatus::Failed) << "\n";
    return out.str();
}

} // namespace redliner::application
