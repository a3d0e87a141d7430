/**
 * @file TcrService.hpp
 * @brief "test && commit || revert" workflow on top of an external command runner.
 */

#pragma once

#include "domain/CommandRunner.hpp"
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace taskwalker::application {

class TaskService;

/**
 * @struct CommitResult
 * @brief Outcome of the stage + commit sequence.
 */
struct CommitResult {
    bool ok = false;
    std::string failedStep; ///< "git add" or "git commit" when !ok.
    std::string detail;     ///< Human-readable reason when !ok.
};

/**
 * @enum TcrOutcome
 * @brief What a test-and-commit cycle ended up doing.
 */
enum class TcrOutcome {
    Committed,          ///< Tests passed, tasks saved, commit created.
    CommitFailed,       ///< Tests passed, tasks saved, commit step failed.
    SavedWithoutCommit, ///< Tests passed, tasks saved, no task selected to name the commit.
    Reverted,           ///< Tests failed, working tree restored.
    RevertFailed,       ///< Tests failed, restoring the working tree failed too.
    TestsFailed         ///< Tests failed, revert disabled by configuration.
};

std::string OutcomeToString(TcrOutcome outcome);

/**
 * @class TcrService
 * @brief Runs the user's test command and drives git accordingly.
 */
class TcrService {
public:
    explicit TcrService(std::shared_ptr<domain::CommandRunner> runner, bool revertOnFailure = true);

    /** @brief Splits a command line on whitespace. No quoting rules apply. */
    static std::vector<std::string> SplitCommand(const std::string& commandText);

    /** @brief Commit message naming the task the cycle was about. */
    static std::string CommitMessageFor(const std::string& description);

    /**
     * @brief Runs the test command and waits for it.
     * @return True only if the program started and exited with status 0.
     *         An empty or whitespace-only command fails without spawning anything.
     */
    bool RunTestCommand(const std::string& commandText);

    /** @brief "git add -A" then "git commit -m <message>". Stops at the first failing step. */
    CommitResult Commit(const std::string& message);

    /** @brief Discards all local modifications to tracked files ("git checkout -- ."). */
    bool Revert();

    /**
     * @brief Full TCR cycle used by the 't' key.
     * @param testCommand Command to run.
     * @param tasks Task list, saved before committing and reloaded after a revert.
     * @param selectedIndex Selected task; names the commit.
     * @param out Progress messages for the user.
     * @throws infrastructure::PersistenceError if saving or reloading the task file fails.
     */
    TcrOutcome RunCycle(const std::string& testCommand, TaskService& tasks,
                        std::size_t selectedIndex, std::ostream& out);

private:
    bool RunGit(const std::vector<std::string>& args);

    std::shared_ptr<domain::CommandRunner> m_runner;
    bool m_revertOnFailure;
};

} // namespace taskwalker::application
