/**
 * @file TaskWalkerApp.hpp
 * @brief Main application class for TaskWalker.
 */

#pragma once

#include <memory>
#include <string>

#include "application/AppServices.hpp"
#include "application/InputRouter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "ui/AppState.hpp"

namespace taskwalker::ui {
class TerminalSession;
class UiRenderer;
}

namespace taskwalker::app {

/**
 * @class TaskWalkerApp
 * @brief Orchestrates the application lifecycle: initialization, the main loop, and shutdown.
 */
class TaskWalkerApp {
public:
    /**
     * @param projectRoot Directory holding the task file and the optional settings file.
     */
    explicit TaskWalkerApp(std::string projectRoot = ".");
    ~TaskWalkerApp();

    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     * @throws ui::TerminalError, infrastructure::PersistenceError after restoring the terminal.
     */
    int Run();

private:
    /** @brief Loads settings and tasks, builds the services, enters curses mode. */
    void Init();

    /** @brief Restores the terminal. */
    void Shutdown();

    /** @brief Routes one key and applies the resulting effects. */
    void HandleKey(const domain::KeyEvent& key);

    void ApplyEffect(const application::Effect& effect);

    /** @brief The 't' action: suspend the UI, run TCR, wait for Enter, resume. */
    void RunTestAndCommit();

    std::string m_projectRoot;
    infrastructure::AppConfig m_config;
    application::AppServices m_services;
    ui::AppState m_state;
    std::unique_ptr<ui::TerminalSession> m_terminal;
    std::unique_ptr<ui::UiRenderer> m_renderer;
};

} // namespace taskwalker::app
