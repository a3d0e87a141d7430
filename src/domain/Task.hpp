/**
 * @file Task.hpp
 * @brief Domain entity representing a single task and its status lifecycle.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace taskwalker::domain {

/**
 * @enum TaskStatus
 * @brief Lifecycle status of a task.
 */
enum class TaskStatus {
    Pending,   ///< Not started yet.
    Working,   ///< Currently being worked on.
    Done       ///< Finished.
};

/**
 * @brief Helper to convert a status to its canonical name (used by the JSON export).
 */
inline std::string StatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "Pending";
        case TaskStatus::Working: return "Working";
        case TaskStatus::Done: return "Done";
    }
    return "Pending";
}

/**
 * @brief Returns the next status in the toggle cycle Pending -> Done -> Working -> Pending.
 */
inline TaskStatus NextStatus(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return TaskStatus::Done;
        case TaskStatus::Done: return TaskStatus::Working;
        case TaskStatus::Working: return TaskStatus::Pending;
    }
    return TaskStatus::Pending;
}

/**
 * @brief True if the text is empty or contains only whitespace.
 */
inline bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

/**
 * @struct Task
 * @brief A task on the list. Identity is positional; there is no stable id.
 */
struct Task {
    std::string description; ///< Never blank once the task exists.
    TaskStatus status = TaskStatus::Pending; ///< Current status.

    /**
     * @brief Constructor for Task.
     * @param desc Task description.
     * @param initialStatus Initial status.
     */
    Task(const std::string& desc, TaskStatus initialStatus = TaskStatus::Pending)
        : description(desc), status(initialStatus) {}

    bool operator==(const Task& other) const {
        return description == other.description && status == other.status;
    }
    bool operator!=(const Task& other) const { return !(*this == other); }
};

} // namespace taskwalker::domain
