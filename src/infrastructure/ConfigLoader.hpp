/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (.taskwalker.json).
 *
 * Keeps the JSON parsing of settings in one place. The settings file is
 * optional and read-only: the application never writes it back.
 */

#pragma once

#include <string>

namespace taskwalker::infrastructure {

/**
 * @struct AppConfig
 * @brief Startup settings with their defaults.
 */
struct AppConfig {
    std::string tasksFile = "tasks.md";   ///< Primary checklist store.
    std::string exportFile = "tasks.json"; ///< Target of the JSON export.
    std::string testCommand;              ///< Initial test command for the session.
    int pollTimeoutMs = 100;              ///< Max wait for a key per loop iteration.
    bool revertOnFailure = true;          ///< Discard working-tree changes when tests fail.
};

class ConfigLoader {
public:
    /** @brief Name of the settings file looked up in the project root. */
    static constexpr const char* kConfigFileName = ".taskwalker.json";

    /**
     * @brief Reads the settings file from the project root.
     * @param projectRoot Directory containing the settings file.
     * @return Settings with defaults for anything missing, unreadable or of the wrong type.
     */
    static AppConfig Load(const std::string& projectRoot);
};

} // namespace taskwalker::infrastructure
