/**
 * @file ManifestWriter.hpp
 * @brief JSON manifest and console summary of a revision run.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "application/OperationInterpreter.hpp"

namespace redliner::application {

/**
 * @struct ManifestInfo
 * @brief Paths echoed into the manifest header.
 */
struct ManifestInfo {
    std::string input;
    std::string operations;
    std::string output;
    std::string advisor;
};

class ManifestWriter {
public:
    /** @brief One object per operation, in list order, plus totals. */
    static nlohmann::json ToJson(const ExecutionReport& report, const ManifestInfo& info);

    /** @brief Writes the manifest atomically. @throws domain::SerializationError on I/O failure. */
    static void Save(const std::string& path, const ExecutionReport& report, const ManifestInfo& info);

    /** @brief Human-readable table: one line per operation and a totals line. */
    static std::string Summary(const ExecutionReport& report);
};

} // namespace redliner::application
