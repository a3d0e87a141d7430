/**
 * @file TcrService.cpp
 * @brief Implementation of TcrService.
 */

#include "application/TcrService.hpp"
#include "application/TaskService.hpp"
#include <sstream>

namespace taskwalker::application {

std::string OutcomeToString(TcrOutcome outcome) {
    switch (outcome) {
        case TcrOutcome::Committed: return "Committed";
        case TcrOutcome::CommitFailed: return "CommitFailed";
        case TcrOutcome::SavedWithoutCommit: return "SavedWithoutCommit";
        case TcrOutcome::Reverted: return "Reverted";
        case TcrOutcome::RevertFailed: return "RevertFailed";
        case TcrOutcome::TestsFailed: return "TestsFailed";
    }
    return "TestsFailed";
}

TcrService::TcrService(std::shared_ptr<domain::CommandRunner> runner, bool revertOnFailure)
    : m_runner(std::move(runner)), m_revertOnFailure(revertOnFailure) {}

std::vector<std::string> TcrService::SplitCommand(const std::string& commandText) {
    std::vector<std::string> parts;
    std::istringstream ss(commandText);
    std::string token;
    while (ss >> token) {
        parts.push_back(token);
    }
    return parts;
}

std::string TcrService::CommitMessageFor(const std::string& description) {
    return "TCR: completed task \"" + description + "\"";
}

bool TcrService::RunTestCommand(const std::string& commandText) {
    auto argv = SplitCommand(commandText);
    if (argv.empty()) return false;
    auto status = m_runner->run(argv);
    return status.has_value() && *status == 0;
}

bool TcrService::RunGit(const std::vector<std::string>& args) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto status = m_runner->run(argv);
    return status.has_value() && *status == 0;
}

CommitResult TcrService::Commit(const std::string& message) {
    if (!RunGit({"add", "-A"})) {
        return {false, "git add", "git add failed"};
    }
    if (!RunGit({"commit", "-m", message})) {
        return {false, "git commit", "git commit failed"};
    }
    return {true, "", ""};
}

bool TcrService::Revert() {
    return RunGit({"checkout", "--", "."});
}

TcrOutcome TcrService::RunCycle(const std::string& testCommand, TaskService& tasks,
                                std::size_t selectedIndex, std::ostream& out) {
    out << "[Tcr] Running test command: " << testCommand << std::endl;

    if (RunTestCommand(testCommand)) {
        out << "[Tcr] Tests passed." << std::endl;
        tasks.Save();

        if (selectedIndex >= tasks.Count()) {
            out << "[Tcr] No task selected, tasks saved without committing." << std::endl;
            return TcrOutcome::SavedWithoutCommit;
        }

        std::string message = CommitMessageFor(tasks.GetTasks()[selectedIndex].description);
        CommitResult result = Commit(message);
        if (!result.ok) {
            out << "[Tcr] WARNING: Commit failed: " << result.detail << std::endl;
            return TcrOutcome::CommitFailed;
        }
        out << "[Tcr] Committed: " << message << std::endl;
        return TcrOutcome::Committed;
    }

    out << "[Tcr] Tests failed, not committing." << std::endl;
    if (!m_revertOnFailure) {
        return TcrOutcome::TestsFailed;
    }
    if (!Revert()) {
        out << "[Tcr] WARNING: Reverting local changes failed." << std::endl;
        return TcrOutcome::RevertFailed;
    }
    // The checkout rewrote the task file; the list must follow it.
    tasks.Load();
    out << "[Tcr] Local changes reverted, reloaded " << tasks.Count() << " tasks." << std::endl;
    return TcrOutcome::Reverted;
}

} // namespace taskwalker::application
