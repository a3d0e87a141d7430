/**
 * @file TaskRepository.hpp
 * @brief Interfaces for persisting and exporting the task list.
 */

#pragma once
#include <vector>
#include "Task.hpp"

namespace taskwalker::domain {

/**
 * @class TaskRepository
 * @brief Abstract interface for the primary task storage.
 */
class TaskRepository {
public:
    virtual ~TaskRepository() = default;

    /**
     * @brief Reads the stored task list.
     * @return The tasks in storage order. A missing store yields an empty list.
     * @throws infrastructure::PersistenceError if the store exists but cannot be read.
     */
    virtual std::vector<Task> load() = 0;

    /**
     * @brief Replaces the stored task list with the given one.
     * @throws infrastructure::PersistenceError if the store cannot be written.
     */
    virtual void save(const std::vector<Task>& tasks) = 0;
};

/**
 * @class TaskExporter
 * @brief Abstract interface for a secondary, write-only export of the task list.
 */
class TaskExporter {
public:
    virtual ~TaskExporter() = default;

    /** @brief Overwrites the export target with the full list. */
    virtual void exportTasks(const std::vector<Task>& tasks) = 0;
};

} // namespace taskwalker::domain
