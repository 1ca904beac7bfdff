/**
 * @file PersistenceService.hpp
 * @brief Atomic file writes for the revised document and its manifest.
 */

#pragma once
#include <string>
#include <vector>

namespace redliner::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes files through a temporary sibling and a rename.
 *
 * A reader never sees a half-written output: either the previous file or the
 * complete new one is at `filename`.
 */
class PersistenceService {
public:
    /**
     * @brief Saves text content, creating parent directories as needed.
     * @throws domain::SerializationError if any step fails. The temp file is removed.
     */
    static void SaveText(const std::string& filename, const std::string& content);

    /** @brief Reads a whole file as bytes. @throws domain::SerializationError if unreadable. */
    static std::vector<unsigned char> ReadBytes(const std::string& filename);
};

} // namespace redliner::infrastructure
