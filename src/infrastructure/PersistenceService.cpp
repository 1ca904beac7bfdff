/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include "domain/Errors.hpp"

namespace redliner::infrastructure {

namespace fs = std::filesystem;

namespace {
    void RemoveQuietly(const fs::path& path) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            std::cerr << "[PersistenceService] Could not remove temp file " << path << ": " << ec.message() << std::endl;
        }
    }
}

void PersistenceService::SaveText(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::SerializationError("Cannot create directory " + finalPath.parent_path().string() + ": " +
                                             ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            throw domain::SerializationError("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            RemoveQuietly(tempPath);
            throw domain::SerializationError("Write failed: " + tempPath.string());
        }
    }

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        RemoveQuietly(tempPath);
        throw domain::SerializationError("Rename to " + finalPath.string() + " failed: " + ec.message());
    }
    std::cout << "[PersistenceService] Wrote " << finalPath.string() << " (" << content.size() << " bytes)" << std::endl;
}

std::vector<unsigned char> PersistenceService::ReadBytes(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        throw domain::SerializationError("Cannot open " + filename);
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw domain::SerializationError("Read failed: " + filename);
    }
    return bytes;
}

} // namespace redliner::infrastructure
