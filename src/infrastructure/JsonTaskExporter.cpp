/**
 * @file JsonTaskExporter.cpp
 * @brief Implementation of JsonTaskExporter.
 */

#include "infrastructure/JsonTaskExporter.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <nlohmann/json.hpp>

namespace taskwalker::infrastructure {

using json = nlohmann::json;

JsonTaskExporter::JsonTaskExporter(std::string filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {}

std::string JsonTaskExporter::ToJson(const std::vector<domain::Task>& tasks) {
    json j = json::array();
    for (const auto& task : tasks) {
        j.push_back({
            {"description", task.description},
            {"status", domain::StatusToString(task.status)}
        });
    }
    return j.dump(4);
}

void JsonTaskExporter::exportTasks(const std::vector<domain::Task>& tasks) {
    m_persistence->saveText(m_filePath, ToJson(tasks));
}

} // namespace taskwalker::infrastructure
