/**
 * @file TaskService.cpp
 * @brief Implementation of the TaskService class.
 */

#include "application/TaskService.hpp"

namespace taskwalker::application {

TaskService::TaskService(std::unique_ptr<domain::TaskRepository> repo, std::unique_ptr<domain::TaskExporter> exporter)
    : m_repo(std::move(repo)), m_exporter(std::move(exporter)) {}

void TaskService::Load() {
    m_tasks = m_repo->load();
}

bool TaskService::AddTask(const std::string& description) {
    if (domain::IsBlank(description)) return false;
    m_tasks.emplace_back(description, domain::TaskStatus::Pending);
    Save();
    return true;
}

bool TaskService::EditTask(std::size_t index, const std::string& description) {
    if (index >= m_tasks.size() || domain::IsBlank(description)) return false;
    m_tasks[index].description = description;
    Save();
    return true;
}

bool TaskService::DeleteTask(std::size_t index) {
    if (index >= m_tasks.size()) return false;
    m_tasks.erase(m_tasks.begin() + static_cast<std::ptrdiff_t>(index));
    Save();
    return true;
}

bool TaskService::CycleStatus(std::size_t index) {
    if (index >= m_tasks.size()) return false;
    m_tasks[index].status = domain::NextStatus(m_tasks[index].status);
    Save();
    return true;
}

void TaskService::Save() {
    m_repo->save(m_tasks);
}

void TaskService::Export() {
    m_exporter->exportTasks(m_tasks);
}

} // namespace taskwalker::application
