/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace taskwalker::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

void ReadSettingsFile(const std::filesystem::path& configPath, AppConfig& config) {
    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath.string() << ": " << e.what() << std::endl;
        return;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath.string() << " is not a JSON object, using defaults." << std::endl;
        return;
    }

    ReadKey(j, "tasks_file", config.tasksFile);
    ReadKey(j, "export_file", config.exportFile);
    ReadKey(j, "test_command", config.testCommand);
    ReadKey(j, "poll_timeout_ms", config.pollTimeoutMs);
    ReadKey(j, "revert_on_failure", config.revertOnFailure);

    if (config.pollTimeoutMs <= 0) {
        std::cerr << "[ConfigLoader] poll_timeout_ms must be positive, using 100." << std::endl;
        config.pollTimeoutMs = AppConfig{}.pollTimeoutMs;
    }
    if (config.tasksFile.empty()) config.tasksFile = AppConfig{}.tasksFile;
    if (config.exportFile.empty()) config.exportFile = AppConfig{}.exportFile;
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& projectRoot) {
    AppConfig config;
    std::filesystem::path root(projectRoot);
    std::filesystem::path configPath = root / kConfigFileName;
    if (std::filesystem::exists(configPath)) {
        ReadSettingsFile(configPath, config);
    }

    // Relative paths are resolved against the project root.
    auto resolve = [&root](std::string& path) {
        std::filesystem::path p(path);
        if (p.is_relative()) path = (root / p).string();
    };
    resolve(config.tasksFile);
    resolve(config.exportFile);
    return config;
}

} // namespace taskwalker::infrastructure
