/**
 * @file TerminalSession.hpp
 * @brief RAII wrapper around the ncurses screen with an explicit suspended state.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "domain/InteractionState.hpp"

typedef struct screen SCREEN;

namespace taskwalker::ui {

/**
 * @class TerminalError
 * @brief Raised when the terminal cannot be set up, suspended or restored.
 */
class TerminalError : public std::runtime_error {
public:
    explicit TerminalError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class TerminalSession
 * @brief Owns the full-screen curses session for the lifetime of the app.
 *
 * States: Active (curses owns the terminal), Suspended (the shell screen is
 * back, so external programs can print and read stdin), Closed. Suspend() is
 * only legal from Active and Resume() only from Suspended. A failed Resume()
 * throws and leaves the session Suspended; the destructor still restores the
 * terminal.
 */
class TerminalSession {
public:
    enum class State { Active, Suspended, Closed };

    /**
     * @brief Enters curses mode.
     * @param pollTimeoutMs Max time PollKey() blocks waiting for input.
     * @throws TerminalError if the terminal cannot be initialized.
     */
    explicit TerminalSession(int pollTimeoutMs);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    /** @brief Waits up to the poll timeout for a key. */
    std::optional<domain::KeyEvent> PollKey();

    /** @brief Hands the terminal back to the shell screen. */
    void Suspend();

    /** @brief Takes the terminal back after Suspend() and forces a full redraw. */
    void Resume();

    /** @brief Leaves curses mode for good. Safe to call more than once. */
    void Close() noexcept;

    bool HasColors() const { return m_hasColors; }

    /** @brief Maps a curses key code to a KeyEvent. */
    static domain::KeyEvent TranslateKey(int ch);

private:
    SCREEN* m_screen = nullptr;
    State m_state = State::Closed;
    bool m_hasColors = false;
};

} // namespace taskwalker::ui
