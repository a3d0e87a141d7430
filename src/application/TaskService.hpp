/**
 * @file TaskService.hpp
 * @brief Service owning the in-memory task list and keeping it in sync with storage.
 */

#pragma once

#include "domain/Task.hpp"
#include "domain/TaskRepository.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace taskwalker::application {

/**
 * @class TaskService
 * @brief Single owner of the task list. Every successful mutation rewrites the store.
 *
 * Mutations that would break an invariant (blank description, index out of
 * range) return false and leave both the list and the store untouched.
 * Storage failures propagate as infrastructure::PersistenceError.
 */
class TaskService {
public:
    TaskService(std::unique_ptr<domain::TaskRepository> repo, std::unique_ptr<domain::TaskExporter> exporter);

    /** @brief Replaces the in-memory list with the stored one. */
    void Load();

    /** @brief Current list in insertion/edit order. */
    const std::vector<domain::Task>& GetTasks() const { return m_tasks; }

    std::size_t Count() const { return m_tasks.size(); }
    bool Empty() const { return m_tasks.empty(); }

    /** @brief Appends a Pending task. Rejects blank descriptions. */
    bool AddTask(const std::string& description);

    /** @brief Replaces the description of the task at index. Rejects blank descriptions. */
    bool EditTask(std::size_t index, const std::string& description);

    /** @brief Removes the task at index. */
    bool DeleteTask(std::size_t index);

    /** @brief Advances the task at index along Pending -> Done -> Working -> Pending. */
    bool CycleStatus(std::size_t index);

    /** @brief Writes the current list to the store. */
    void Save();

    /** @brief Writes the current list to the export target. */
    void Export();

private:
    std::unique_ptr<domain::TaskRepository> m_repo;
    std::unique_ptr<domain::TaskExporter> m_exporter;
    std::vector<domain::Task> m_tasks;
};

} // namespace taskwalker::application
