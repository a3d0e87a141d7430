/**
 * @file MarkdownTaskRepository.cpp
 * @brief Implementation of the MarkdownTaskRepository class.
 */
#include "infrastructure/MarkdownTaskRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace taskwalker::infrastructure {

namespace {

constexpr const char* kChecklistPrefix = "- [";
constexpr std::size_t kMarkerLength = 5; // "- [ ]"

std::string Trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

const char* MarkerFor(domain::TaskStatus status) {
    switch (status) {
        case domain::TaskStatus::Working: return "- [~]";
        case domain::TaskStatus::Done: return "- [x]";
        case domain::TaskStatus::Pending: return "- [ ]";
    }
    return "- [ ]";
}

const char* SectionFor(domain::TaskStatus status) {
    switch (status) {
        case domain::TaskStatus::Working: return "## Working";
        case domain::TaskStatus::Done: return "## Done";
        case domain::TaskStatus::Pending: return "## Pending";
    }
    return "## Pending";
}

} // namespace

MarkdownTaskRepository::MarkdownTaskRepository(std::string filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {}

std::vector<domain::Task> MarkdownTaskRepository::load() {
    if (!fs::exists(m_filePath)) return {};

    std::ifstream file(m_filePath);
    if (!file.is_open()) {
        throw PersistenceError(m_filePath, "cannot open for reading");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseMarkdown(buffer.str());
}

void MarkdownTaskRepository::save(const std::vector<domain::Task>& tasks) {
    m_persistence->saveText(m_filePath, RenderMarkdown(tasks));
}

std::vector<domain::Task> MarkdownTaskRepository::ParseMarkdown(const std::string& content) {
    std::vector<domain::Task> tasks;
    std::stringstream ss(content);
    std::string rawLine;
    while (std::getline(ss, rawLine)) {
        std::string line = Trim(rawLine);
        if (line.rfind(kChecklistPrefix, 0) != 0) continue;

        domain::TaskStatus status = domain::TaskStatus::Pending;
        if (line.rfind("- [x]", 0) == 0) status = domain::TaskStatus::Done;
        else if (line.rfind("- [~]", 0) == 0) status = domain::TaskStatus::Working;

        std::string desc = line.size() > kMarkerLength ? Trim(line.substr(kMarkerLength)) : "";
        if (!desc.empty()) {
            tasks.emplace_back(desc, status);
        }
    }
    return tasks;
}

std::string MarkdownTaskRepository::RenderMarkdown(const std::vector<domain::Task>& tasks) {
    static const domain::TaskStatus kSectionOrder[] = {
        domain::TaskStatus::Working,
        domain::TaskStatus::Pending,
        domain::TaskStatus::Done,
    };

    std::stringstream ss;
    ss << "# Tasks\n";
    for (domain::TaskStatus status : kSectionOrder) {
        bool headerWritten = false;
        for (const auto& task : tasks) {
            if (task.status != status) continue;
            if (!headerWritten) {
                ss << "\n" << SectionFor(status) << "\n";
                headerWritten = true;
            }
            ss << MarkerFor(status) << " " << task.description << "\n";
        }
    }
    return ss.str();
}

} // namespace taskwalker::infrastructure
