/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace taskwalker::infrastructure {

namespace fs = std::filesystem;

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Temp path next to the target so the rename stays on one filesystem: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw PersistenceError(filename, "cannot create directory: " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw PersistenceError(filename, "cannot open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw PersistenceError(filename, "write to temp file failed");
        }
    }

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw PersistenceError(filename, "rename failed: " + ec.message());
    }
}

} // namespace taskwalker::infrastructure
