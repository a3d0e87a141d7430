/**
 * @file TaskWalkerApp.cpp
 * @brief Implementation of the TaskWalkerApp class.
 */
#include "app/TaskWalkerApp.hpp"

#include "infrastructure/JsonTaskExporter.hpp"
#include "infrastructure/MarkdownTaskRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/PosixCommandRunner.hpp"
#include "ui/TerminalSession.hpp"
#include "ui/UiRenderer.hpp"

#include <iostream>
#include <string>
#include <variant>

namespace taskwalker::app {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

TaskWalkerApp::TaskWalkerApp(std::string projectRoot)
    : m_projectRoot(std::move(projectRoot)) {}

TaskWalkerApp::~TaskWalkerApp() {
    Shutdown();
}

void TaskWalkerApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_projectRoot);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_unique<infrastructure::MarkdownTaskRepository>(m_config.tasksFile, persistence);
    auto exporter = std::make_unique<infrastructure::JsonTaskExporter>(m_config.exportFile, persistence);
    auto runner = std::make_shared<infrastructure::PosixCommandRunner>();

    m_services.taskService = std::make_unique<application::TaskService>(std::move(repo), std::move(exporter));
    m_services.tcrService = std::make_unique<application::TcrService>(runner, m_config.revertOnFailure);

    m_services.taskService->Load();
    m_state.interaction = domain::InteractionState{};
    m_state.interaction.testCommand = m_config.testCommand;
    m_state.AppendLog("[TaskWalkerApp] Loaded " + std::to_string(m_services.taskService->Count()) +
                      " tasks from " + m_config.tasksFile);

    m_terminal = std::make_unique<ui::TerminalSession>(m_config.pollTimeoutMs);
    m_renderer = std::make_unique<ui::UiRenderer>(m_terminal->HasColors());
}

void TaskWalkerApp::Shutdown() {
    if (m_terminal) {
        m_terminal->Close();
        m_terminal.reset();
    }
    m_renderer.reset();
}

int TaskWalkerApp::Run() {
    try {
        Init();
        while (!m_state.requestExit) {
            m_renderer->Draw(m_state, m_services.taskService->GetTasks());
            if (auto key = m_terminal->PollKey()) {
                HandleKey(*key);
            }
        }
    } catch (...) {
        // Give the terminal back before the caller prints the diagnostic.
        Shutdown();
        throw;
    }
    Shutdown();
    return 0;
}

void TaskWalkerApp::HandleKey(const domain::KeyEvent& key) {
    m_state.ClearStatus();
    auto result = application::InputRouter::Route(m_state.interaction, m_services.taskService->GetTasks(), key);
    m_state.interaction = std::move(result.state);
    for (const auto& effect : result.effects) {
        ApplyEffect(effect);
    }
}

void TaskWalkerApp::ApplyEffect(const application::Effect& effect) {
    auto& tasks = *m_services.taskService;
    std::visit(Overloaded{
        [&](const application::effects::AddTask& e) {
            if (tasks.AddTask(e.description)) {
                m_state.AppendLog("Added task: " + e.description);
            }
        },
        [&](const application::effects::EditTask& e) {
            if (tasks.EditTask(e.index, e.description)) {
                m_state.AppendLog("Updated task: " + e.description);
            }
        },
        [&](const application::effects::DeleteTask& e) {
            if (e.index >= tasks.Count()) return;
            std::string description = tasks.GetTasks()[e.index].description;
            if (tasks.DeleteTask(e.index)) {
                m_state.AppendLog("Deleted task: " + description);
            }
        },
        [&](const application::effects::CycleStatus& e) {
            if (tasks.CycleStatus(e.index)) {
                const auto& task = tasks.GetTasks()[e.index];
                m_state.AppendLog(task.description + " -> " + domain::StatusToString(task.status));
            }
        },
        [&](const application::effects::ExportTasks&) {
            tasks.Export();
            m_state.AppendLog("Exported " + std::to_string(tasks.Count()) + " tasks to " + m_config.exportFile);
        },
        [&](const application::effects::TestAndCommit&) {
            RunTestAndCommit();
        },
        [&](const application::effects::Warn& e) {
            m_state.Warn(e.message);
        },
        [&](const application::effects::Quit&) {
            m_state.requestExit = true;
        },
    }, effect);
}

void TaskWalkerApp::RunTestAndCommit() {
    m_terminal->Suspend();

    std::cout << std::endl;
    auto outcome = m_services.tcrService->RunCycle(m_state.interaction.testCommand,
                                                   *m_services.taskService,
                                                   m_state.interaction.selectedIndex,
                                                   std::cout);

    std::cout << "Press Enter to return to UI..." << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cin.clear();
    }

    m_terminal->Resume();
    application::InputRouter::ClampSelection(m_state.interaction, m_services.taskService->Count());
    m_state.AppendLog("[Tcr] " + application::OutcomeToString(outcome));
    if (outcome != application::TcrOutcome::Committed) {
        m_state.statusIsWarning = true;
    }
}

} // namespace taskwalker::app
