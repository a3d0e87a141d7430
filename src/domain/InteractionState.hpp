/**
 * @file InteractionState.hpp
 * @brief Value objects for the interaction state machine: modes and key events.
 */

#pragma once

#include <cstddef>
#include <string>

namespace taskwalker::domain {

/**
 * @enum Mode
 * @brief Interaction mode of the task list UI.
 */
enum class Mode {
    View,            ///< Browsing the list. Initial mode.
    AddInput,        ///< Typing the description of a new task.
    EditInput,       ///< Editing the description of the selected task.
    SetTestCommand   ///< Typing the command used by the test-and-commit action.
};

/** @brief True for the three modes that own a text input buffer. */
inline bool IsInputMode(Mode mode) {
    return mode != Mode::View;
}

/**
 * @enum KeyCode
 * @brief Terminal-independent key classification.
 */
enum class KeyCode {
    Char,       ///< Printable character, see KeyEvent::ch.
    Enter,
    Escape,
    Backspace,
    Up,
    Down,
    Other       ///< Anything the application has no binding for.
};

/**
 * @struct KeyEvent
 * @brief A single key press delivered by the terminal layer.
 */
struct KeyEvent {
    KeyCode code = KeyCode::Other;
    char ch = '\0'; ///< Only meaningful when code == KeyCode::Char.

    static KeyEvent Char(char c) { return KeyEvent{KeyCode::Char, c}; }
    static KeyEvent Of(KeyCode code) { return KeyEvent{code, '\0'}; }
};

/**
 * @struct InteractionState
 * @brief Mode, selection and input buffer owned by the run loop.
 */
struct InteractionState {
    Mode mode = Mode::View;
    std::size_t selectedIndex = 0; ///< Always within [0, size-1], or 0 for an empty list.
    std::string inputBuffer;       ///< Text typed in the current input mode.
    std::string testCommand;       ///< Command run by the test-and-commit action. Not persisted.
};

} // namespace taskwalker::domain
