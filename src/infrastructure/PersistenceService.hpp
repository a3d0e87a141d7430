/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file writes.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace taskwalker::infrastructure {

/**
 * @class PersistenceError
 * @brief Raised when a task or export file cannot be read or written.
 *        Fatal to the operation that triggered the I/O.
 */
class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& path, const std::string& reason)
        : std::runtime_error(path + ": " + reason), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @class PersistenceService
 * @brief Performs whole-file rewrites through a temp file and a rename.
 *
 * A reader never observes a half-written file: either the previous content
 * or the new content is on disk.
 */
class PersistenceService {
public:
    /**
     * @brief Writes the content to the file, replacing it atomically.
     * @param filename Target path. Missing parent directories are created.
     * @param content The full new content.
     * @throws PersistenceError on any I/O failure. The temp file is removed.
     */
    void saveText(const std::string& filename, const std::string& content);
};

} // namespace taskwalker::infrastructure
