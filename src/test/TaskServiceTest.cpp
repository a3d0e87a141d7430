#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "application/TaskService.hpp"
#include "infrastructure/JsonTaskExporter.hpp"
#include "infrastructure/MarkdownTaskRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace taskwalker::domain;
using namespace taskwalker::application;
using namespace taskwalker::infrastructure;

// In-memory repository that records every save.
class MemoryRepository : public TaskRepository {
public:
    explicit MemoryRepository(std::vector<Task> initial = {}) : stored(std::move(initial)) {}

    std::vector<Task> load() override { return stored; }
    void save(const std::vector<Task>& tasks) override {
        stored = tasks;
        ++saveCount;
    }

    std::vector<Task> stored;
    int saveCount = 0;
};

class MemoryExporter : public TaskExporter {
public:
    void exportTasks(const std::vector<Task>& tasks) override {
        exported = tasks;
        ++exportCount;
    }

    std::vector<Task> exported;
    int exportCount = 0;
};

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

struct Fixture {
    MemoryRepository* repo;
    MemoryExporter* exporter;
    std::unique_ptr<TaskService> service;
};

Fixture MakeService(std::vector<Task> initial = {}) {
    auto repo = std::make_unique<MemoryRepository>(std::move(initial));
    auto exporter = std::make_unique<MemoryExporter>();
    Fixture f{repo.get(), exporter.get(), nullptr};
    f.service = std::make_unique<TaskService>(std::move(repo), std::move(exporter));
    f.service->Load();
    return f;
}

void TestMutationsPersist() {
    auto f = MakeService({{"one"}});
    assert(f.service->Count() == 1);
    assert(f.repo->saveCount == 0);

    assert(f.service->AddTask("two"));
    assert(f.repo->saveCount == 1);
    assert(f.repo->stored.size() == 2);
    assert(f.repo->stored[1] == Task("two", TaskStatus::Pending));

    assert(f.service->EditTask(0, "uno"));
    assert(f.repo->stored[0].description == "uno");

    assert(f.service->CycleStatus(1));
    assert(f.repo->stored[1].status == TaskStatus::Done);

    assert(f.service->DeleteTask(0));
    assert(f.repo->saveCount == 4);
    std::vector<Task> expected = {Task("two", TaskStatus::Done)};
    assert(f.service->GetTasks() == expected);

    f.service->Export();
    assert(f.exporter->exportCount == 1);
    assert(f.exporter->exported == f.service->GetTasks());
    std::cout << "[PASS] Every mutation rewrites the store." << std::endl;
}

void TestBlankDescriptionsLeaveListUnchanged() {
    auto f = MakeService({{"keep", TaskStatus::Working}});
    const auto before = f.service->GetTasks();
    for (const std::string blank : {"", " ", "\t", "  \t \n"}) {
        assert(!f.service->AddTask(blank));
        assert(!f.service->EditTask(0, blank));
        assert(f.service->GetTasks() == before);
    }
    assert(f.repo->saveCount == 0);
    std::cout << "[PASS] Blank add/edit leaves the list unchanged." << std::endl;
}

void TestOutOfRangeIsRejected() {
    auto f = MakeService({{"a"}});
    assert(!f.service->EditTask(1, "b"));
    assert(!f.service->DeleteTask(1));
    assert(!f.service->CycleStatus(5));
    assert(f.repo->saveCount == 0);
    std::cout << "[PASS] Out-of-range indexes are rejected." << std::endl;
}

void TestStatusCycle() {
    assert(NextStatus(TaskStatus::Pending) == TaskStatus::Done);
    assert(NextStatus(TaskStatus::Done) == TaskStatus::Working);
    assert(NextStatus(TaskStatus::Working) == TaskStatus::Pending);

    auto f = MakeService({{"p", TaskStatus::Pending}, {"w", TaskStatus::Working}, {"d", TaskStatus::Done}});
    const auto before = f.service->GetTasks();
    for (std::size_t i = 0; i < before.size(); ++i) {
        for (int n = 0; n < 3; ++n) f.service->CycleStatus(i);
    }
    assert(f.service->GetTasks() == before);
    std::cout << "[PASS] Three cycles return every task to its status." << std::endl;
}

void TestAddScenarioOnDisk(const std::string& root) {
    std::string path = root + "/tasks.md";
    std::ofstream(path) << "# Tasks\n\n## Pending\n- [ ] Write design\n";

    auto persistence = std::make_shared<PersistenceService>();
    TaskService service(std::make_unique<MarkdownTaskRepository>(path, persistence),
                        std::make_unique<JsonTaskExporter>(root + "/tasks.json", persistence));
    service.Load();
    assert(service.Count() == 1);

    assert(service.AddTask("Write design 2"));
    std::string content = ReadFile(path);
    assert(content == "# Tasks\n\n## Pending\n- [ ] Write design\n- [ ] Write design 2\n");
    std::cout << "[PASS] Adding to a Pending list keeps the group order on disk." << std::endl;
}

void TestToggleScenarioOnDisk(const std::string& root) {
    std::string path = root + "/toggle.md";
    auto persistence = std::make_shared<PersistenceService>();
    TaskService service(std::make_unique<MarkdownTaskRepository>(path, persistence),
                        std::make_unique<JsonTaskExporter>(root + "/toggle.json", persistence));
    service.Load();
    assert(service.Empty());
    assert(service.AddTask("Toggle me"));
    assert(ReadFile(path).find("## Pending\n- [ ] Toggle me\n") != std::string::npos);

    service.CycleStatus(0);
    std::string afterFirst = ReadFile(path);
    assert(afterFirst.find("## Done\n- [x] Toggle me\n") != std::string::npos);
    assert(afterFirst.find("## Pending") == std::string::npos);

    service.CycleStatus(0);
    std::string afterSecond = ReadFile(path);
    assert(afterSecond.find("## Working\n- [~] Toggle me\n") != std::string::npos);
    assert(afterSecond.find("## Done") == std::string::npos);

    service.Export();
    assert(ReadFile(root + "/toggle.json").find("\"Working\"") != std::string::npos);
    std::cout << "[PASS] Toggling moves the task Pending -> Done -> Working on disk." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Task Service Test..." << std::endl;

    std::string testRoot = "test_root_task_service";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    TestMutationsPersist();
    TestBlankDescriptionsLeaveListUnchanged();
    TestOutOfRangeIsRejected();
    TestStatusCycle();
    TestAddScenarioOnDisk(testRoot);
    TestToggleScenarioOnDisk(testRoot);

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
