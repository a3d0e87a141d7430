/**
 * @file MarkdownTaskRepository.hpp
 * @brief Markdown checklist implementation of the TaskRepository.
 */

#pragma once
#include "domain/TaskRepository.hpp"
#include <memory>
#include <string>
#include <vector>

namespace taskwalker::infrastructure {

class PersistenceService;

/**
 * @class MarkdownTaskRepository
 * @brief Stores tasks as a markdown checklist grouped by status.
 *
 * File layout:
 * @code
 * # Tasks
 *
 * ## Working
 * - [~] description
 *
 * ## Pending
 * - [ ] description
 *
 * ## Done
 * - [x] description
 * @endcode
 * Sections are written only when non-empty. Any line that is not a checklist
 * item is ignored when reading, so the headings never come back as tasks.
 */
class MarkdownTaskRepository : public domain::TaskRepository {
public:
    /**
     * @brief Constructor for MarkdownTaskRepository.
     * @param filePath Path of the markdown file (usually "tasks.md").
     * @param persistence Writer used for the full rewrite on save.
     */
    MarkdownTaskRepository(std::string filePath, std::shared_ptr<PersistenceService> persistence);

    /** @brief Reads the checklist file. @see domain::TaskRepository::load */
    std::vector<domain::Task> load() override;

    /** @brief Rewrites the whole file. @see domain::TaskRepository::save */
    void save(const std::vector<domain::Task>& tasks) override;

    /** @brief Parses checklist lines out of markdown text. */
    static std::vector<domain::Task> ParseMarkdown(const std::string& content);

    /** @brief Renders the status-grouped markdown document. */
    static std::string RenderMarkdown(const std::vector<domain::Task>& tasks);

private:
    std::string m_filePath; ///< Path to the markdown file.
    std::shared_ptr<PersistenceService> m_persistence; ///< Atomic writer.
};

} // namespace taskwalker::infrastructure
