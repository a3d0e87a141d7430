#include <cassert>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "application/TaskService.hpp"
#include "application/TcrService.hpp"
#include "infrastructure/PosixCommandRunner.hpp"

using namespace taskwalker::domain;
using namespace taskwalker::application;

// Records every invocation and answers from a script (default: success).
class ScriptedRunner : public CommandRunner {
public:
    std::optional<int> run(const std::vector<std::string>& argv) override {
        calls.push_back(argv);
        if (results.empty()) return 0;
        auto r = results.front();
        results.pop_front();
        return r;
    }

    std::vector<std::vector<std::string>> calls;
    std::deque<std::optional<int>> results;
};

class MemoryRepository : public TaskRepository {
public:
    std::vector<Task> load() override { ++loadCount; return initial; }
    void save(const std::vector<Task>&) override { ++saveCount; }
    std::vector<Task> initial;
    int saveCount = 0;
    int loadCount = 0;
};

// Fails the test command; "git checkout" puts the committed list back on disk.
class CheckoutRunner : public CommandRunner {
public:
    std::optional<int> run(const std::vector<std::string>& argv) override {
        if (argv.size() > 1 && argv[0] == "git" && argv[1] == "checkout") {
            repo->initial = committed;
            return 0;
        }
        return 1;
    }

    MemoryRepository* repo = nullptr;
    std::vector<Task> committed;
};

class NullExporter : public TaskExporter {
public:
    void exportTasks(const std::vector<Task>&) override {}
};

namespace {

using Argv = std::vector<std::string>;

std::unique_ptr<TaskService> MakeTasks(std::vector<Task> initial, MemoryRepository*& repoOut) {
    auto repo = std::make_unique<MemoryRepository>();
    repo->initial = std::move(initial);
    repoOut = repo.get();
    auto service = std::make_unique<TaskService>(std::move(repo), std::make_unique<NullExporter>());
    service->Load();
    return service;
}

void TestSplitCommand() {
    assert(TcrService::SplitCommand("").empty());
    assert(TcrService::SplitCommand(" \t ").empty());
    assert(TcrService::SplitCommand("make") == Argv({"make"}));
    assert(TcrService::SplitCommand("  ctest   --output-on-failure\t-j4 ") ==
           Argv({"ctest", "--output-on-failure", "-j4"}));
    // No shell quoting.
    assert(TcrService::SplitCommand("sh -c 'a b'") == Argv({"sh", "-c", "'a", "b'"}));
    std::cout << "[PASS] Commands split on whitespace only." << std::endl;
}

void TestEmptyCommandNeverSpawns() {
    auto runner = std::make_shared<ScriptedRunner>();
    TcrService tcr(runner);
    assert(!tcr.RunTestCommand(""));
    assert(!tcr.RunTestCommand("   "));
    assert(runner->calls.empty());
    std::cout << "[PASS] Empty test command fails without spawning." << std::endl;
}

void TestRunTestCommandExitCodes() {
    auto runner = std::make_shared<ScriptedRunner>();
    TcrService tcr(runner);
    runner->results = {0, 2, std::nullopt};
    assert(tcr.RunTestCommand("make test"));
    assert(!tcr.RunTestCommand("make test"));
    assert(!tcr.RunTestCommand("missing-binary"));
    assert(runner->calls.size() == 3);
    assert(runner->calls[0] == Argv({"make", "test"}));
    std::cout << "[PASS] Only exit status 0 counts as success." << std::endl;
}

void TestCommitSequence() {
    auto runner = std::make_shared<ScriptedRunner>();
    TcrService tcr(runner);

    auto ok = tcr.Commit("msg");
    assert(ok.ok);
    assert(runner->calls.size() == 2);
    assert(runner->calls[0] == Argv({"git", "add", "-A"}));
    assert(runner->calls[1] == Argv({"git", "commit", "-m", "msg"}));

    runner->calls.clear();
    runner->results = {1};
    auto addFailed = tcr.Commit("msg");
    assert(!addFailed.ok);
    assert(addFailed.failedStep == "git add");
    assert(runner->calls.size() == 1);

    runner->calls.clear();
    runner->results = {0, 1};
    auto commitFailed = tcr.Commit("msg");
    assert(!commitFailed.ok);
    assert(commitFailed.failedStep == "git commit");
    assert(runner->calls.size() == 2);
    std::cout << "[PASS] Commit stages then commits, stopping at the first failure." << std::endl;
}

void TestCycleCommitsSelectedTask() {
    auto runner = std::make_shared<ScriptedRunner>();
    TcrService tcr(runner);
    MemoryRepository* repo = nullptr;
    auto tasks = MakeTasks({Task("first"), Task("second", TaskStatus::Working)}, repo);

    std::ostringstream out;
    auto outcome = tcr.RunCycle("make test", *tasks, 1, out);
    assert(outcome == TcrOutcome::Committed);
    assert(repo->saveCount == 1);
    assert(runner->calls.size() == 3);
    assert(runner->calls[2] == Argv({"git", "commit", "-m", "TCR: completed task \"second\""}));
    assert(out.str().find("Tests passed") != std::string::npos);
    std::cout << "[PASS] Passing tests save and commit with the task in the message." << std::endl;
}

void TestCycleCommitFailureOnlyWarns() {
    auto runner = std::make_shared<ScriptedRunner>();
    TcrService tcr(runner);
    MemoryRepository* repo = nullptr;
    auto tasks = MakeTasks({Task("only")}, repo);

    runner->results = {0, 0, 1};
    std::ostringstream out;
    auto outcome = tcr.RunCycle("true", *tasks, 0, out);
    assert(outcome == TcrOutcome::CommitFailed);
    assert(repo->saveCount == 1);
    assert(out.str().find("Commit failed") != std::string::npos);
    std::cout << "[PASS] Commit failure is reported without reverting." << std::endl;
}

void TestCycleWithEmptyListSavesOnly() {
    auto runner = std::make_shared<ScriptedRunner>();
    TcrService tcr(runner);
    MemoryRepository* repo = nullptr;
    auto tasks = MakeTasks({}, repo);

    std::ostringstream out;
    auto outcome = tcr.RunCycle("true", *tasks, 0, out);
    assert(outcome == TcrOutcome::SavedWithoutCommit);
    assert(repo->saveCount == 1);
    assert(runner->calls.size() == 1);
    std::cout << "[PASS] Nothing to name the commit after: save only." << std::endl;
}

void TestCycleRevertsOnFailure() {
    auto runner = std::make_shared<ScriptedRunner>();
    TcrService tcr(runner);
    MemoryRepository* repo = nullptr;
    auto tasks = MakeTasks({Task("x")}, repo);

    runner->results = {1, 0};
    std::ostringstream out;
    auto outcome = tcr.RunCycle("make test", *tasks, 0, out);
    assert(outcome == TcrOutcome::Reverted);
    assert(repo->saveCount == 0);
    assert(runner->calls.size() == 2);
    assert(runner->calls[1] == Argv({"git", "checkout", "--", "."}));
    assert(out.str().find("Tests failed, not committing.") != std::string::npos);

    // Empty command: no test spawned, straight to revert.
    runner->calls.clear();
    runner->results = {1};
    outcome = tcr.RunCycle(" ", *tasks, 0, out);
    assert(outcome == TcrOutcome::RevertFailed);
    assert(runner->calls.size() == 1);
    assert(runner->calls[0][0] == "git");

    TcrService noRevert(runner, false);
    runner->calls.clear();
    runner->results = {1};
    outcome = noRevert.RunCycle("make test", *tasks, 0, out);
    assert(outcome == TcrOutcome::TestsFailed);
    assert(runner->calls.size() == 1);
    std::cout << "[PASS] Failing tests revert the working tree." << std::endl;
}

void TestRevertReloadsTaskList() {
    MemoryRepository* repo = nullptr;
    auto tasks = MakeTasks({Task("committed"), Task("added after commit"), Task("another")}, repo);

    auto runner = std::make_shared<CheckoutRunner>();
    runner->repo = repo;
    runner->committed = {Task("committed", TaskStatus::Done)};
    TcrService tcr(runner);

    std::ostringstream out;
    auto outcome = tcr.RunCycle("make test", *tasks, 2, out);
    assert(outcome == TcrOutcome::Reverted);
    assert(repo->loadCount == 2);
    assert(tasks->GetTasks() == runner->committed);
    assert(out.str().find("reloaded 1 tasks") != std::string::npos);

    // The next mutation writes the reverted list, not the stale one.
    assert(tasks->CycleStatus(0));
    assert(tasks->Count() == 1);
    assert(tasks->GetTasks()[0].status == TaskStatus::Working);

    // No successful checkout, no reload.
    TcrService noRevert(runner, false);
    repo->initial = {Task("changed on disk")};
    outcome = noRevert.RunCycle("make test", *tasks, 0, out);
    assert(outcome == TcrOutcome::TestsFailed);
    assert(repo->loadCount == 2);
    assert(tasks->Count() == 1);
    std::cout << "[PASS] A revert reloads the task list from the restored file." << std::endl;
}

void TestPosixCommandRunner() {
    taskwalker::infrastructure::PosixCommandRunner runner;
    assert(runner.run({"true"}) == std::optional<int>(0));
    assert(runner.run({"false"}) == std::optional<int>(1));
    assert(runner.run({"sh", "-c", "exit 3"}) == std::optional<int>(3));
    assert(!runner.run({"taskwalker-no-such-program-xyz"}).has_value());
    assert(!runner.run({}).has_value());

    TcrService tcr(std::make_shared<taskwalker::infrastructure::PosixCommandRunner>());
    assert(tcr.RunTestCommand("true"));
    assert(!tcr.RunTestCommand("false"));
    assert(!tcr.RunTestCommand("taskwalker-no-such-program-xyz --flag"));
    std::cout << "[PASS] PosixCommandRunner reports exit codes and spawn failures." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TCR Service Test..." << std::endl;
    TestSplitCommand();
    TestEmptyCommandNeverSpawns();
    TestRunTestCommandExitCodes();
    TestCommitSequence();
    TestCycleCommitsSelectedTask();
    TestCycleCommitFailureOnlyWarns();
    TestCycleWithEmptyListSavesOnly();
    TestCycleRevertsOnFailure();
    TestRevertReloadsTaskList();
    TestPosixCommandRunner();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
