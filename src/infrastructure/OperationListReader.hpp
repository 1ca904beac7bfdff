/**
 * @file OperationListReader.hpp
 * @brief Reads operation lists (JSON) into OperationEntry records.
 */

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "domain/Operation.hpp"

namespace redliner::infrastructure {

/**
 * @struct OperationList
 * @brief Parsed list plus the envelope metadata that affects execution.
 */
struct OperationList {
    std::vector<domain::OperationEntry> entries;
    std::string logoPath; ///< Resolved image used by replace_with_logo records. Empty if none.
};

/**
 * @class OperationListReader
 * @brief Static parser for the two accepted layouts.
 *
 * Either a bare array of records or
 * `{ "metadata": { "logo_path": ... }, "instructions": { "operations": [...] } }`.
 * A record that cannot become an Operation still yields an entry, with the
 * reason in `error`, so the batch reports it in order.
 */
class OperationListReader {
public:
    /**
     * @param logoOverride Image path taking precedence over metadata.logo_path.
     * @throws domain::SerializationError if the file is unreadable or not one of the layouts.
     */
    static OperationList ReadFile(const std::filesystem::path& path, const std::string& logoOverride = "");

    /** @brief Parses an already loaded JSON value. Relative logo paths resolve against `baseDirectory`. */
    static OperationList Parse(const nlohmann::json& root,
                               const std::filesystem::path& baseDirectory,
                               const std::string& logoOverride = "");

    /** @brief One record. `logoBytes` is the image for replace_with_logo. */
    static domain::OperationEntry ParseRecord(const nlohmann::json& record,
                                              const std::vector<unsigned char>& logoBytes);
};

} // namespace redliner::infrastructure
