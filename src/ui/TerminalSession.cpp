/**
 * @file TerminalSession.cpp
 * @brief Implementation of TerminalSession.
 */
#include "ui/TerminalSession.hpp"
#include "ui/UiRenderer.hpp"

#include <cstdio>
#include <ncurses.h>

namespace taskwalker::ui {

TerminalSession::TerminalSession(int pollTimeoutMs) {
    m_screen = newterm(nullptr, stdout, stdin);
    if (!m_screen) {
        throw TerminalError("Cannot initialize terminal (is TERM set?)");
    }
    set_term(m_screen);
    m_state = State::Active;

    if (raw() == ERR || noecho() == ERR || keypad(stdscr, TRUE) == ERR) {
        Close();
        throw TerminalError("Cannot switch terminal to raw mode");
    }
    set_escdelay(25);
    curs_set(0);
    timeout(pollTimeoutMs);

    if (has_colors() && start_color() == OK) {
        use_default_colors();
        init_pair(kColorSelected, COLOR_YELLOW, -1);
        init_pair(kColorInput, COLOR_GREEN, -1);
        init_pair(kColorWarning, COLOR_RED, -1);
        m_hasColors = true;
    }
}

TerminalSession::~TerminalSession() {
    Close();
}

std::optional<domain::KeyEvent> TerminalSession::PollKey() {
    if (m_state != State::Active) return std::nullopt;
    int ch = getch();
    if (ch == ERR) return std::nullopt;
    return TranslateKey(ch);
}

void TerminalSession::Suspend() {
    if (m_state != State::Active) {
        throw TerminalError("Cannot suspend a terminal session that is not active");
    }
    def_prog_mode();
    if (endwin() == ERR) {
        throw TerminalError("Cannot leave curses mode");
    }
    m_state = State::Suspended;
}

void TerminalSession::Resume() {
    if (m_state != State::Suspended) {
        throw TerminalError("Cannot resume a terminal session that is not suspended");
    }
    reset_prog_mode();
    clearok(curscr, TRUE);
    if (refresh() == ERR) {
        throw TerminalError("Cannot restore the terminal after running external commands");
    }
    m_state = State::Active;
}

void TerminalSession::Close() noexcept {
    if (m_state == State::Closed) return;
    if (m_state == State::Active) {
        endwin();
    }
    m_state = State::Closed;
    if (m_screen) {
        delscreen(m_screen);
        m_screen = nullptr;
    }
}

domain::KeyEvent TerminalSession::TranslateKey(int ch) {
    using domain::KeyCode;
    using domain::KeyEvent;

    switch (ch) {
        case '\n':
        case '\r':
        case KEY_ENTER:
            return KeyEvent::Of(KeyCode::Enter);
        case 27:
            return KeyEvent::Of(KeyCode::Escape);
        case KEY_BACKSPACE:
        case 127:
        case 8:
            return KeyEvent::Of(KeyCode::Backspace);
        case KEY_UP:
            return KeyEvent::Of(KeyCode::Up);
        case KEY_DOWN:
            return KeyEvent::Of(KeyCode::Down);
        default:
            break;
    }
    // Printable ASCII and the raw bytes of multi-byte UTF-8 sequences.
    if ((ch >= 32 && ch < 127) || (ch >= 128 && ch <= 255)) {
        return KeyEvent::Char(static_cast<char>(ch));
    }
    return KeyEvent::Of(KeyCode::Other);
}

} // namespace taskwalker::ui
