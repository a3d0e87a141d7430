/**
 * @file JsonTaskExporter.hpp
 * @brief JSON implementation of the TaskExporter.
 */

#pragma once
#include "domain/TaskRepository.hpp"
#include <memory>
#include <string>

namespace taskwalker::infrastructure {

class PersistenceService;

/**
 * @class JsonTaskExporter
 * @brief Writes the list as a pretty-printed JSON array of {description, status}.
 */
class JsonTaskExporter : public domain::TaskExporter {
public:
    JsonTaskExporter(std::string filePath, std::shared_ptr<PersistenceService> persistence);

    /** @brief Overwrites the export file. @see domain::TaskExporter::exportTasks */
    void exportTasks(const std::vector<domain::Task>& tasks) override;

    /** @brief Returns the JSON document without writing it. */
    static std::string ToJson(const std::vector<domain::Task>& tasks);

private:
    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace taskwalker::infrastructure
