/**
 * @file InputRouter.cpp
 * @brief Implementation of the InputRouter key maps.
 */

#include "application/InputRouter.hpp"

namespace taskwalker::application {

using domain::InteractionState;
using domain::KeyCode;
using domain::KeyEvent;
using domain::Mode;
using domain::Task;

namespace {

InteractionState EnterMode(const InteractionState& state, Mode mode, std::string seed) {
    InteractionState next = state;
    next.mode = mode;
    next.inputBuffer = std::move(seed);
    return next;
}

InteractionState BackToView(const InteractionState& state) {
    InteractionState next = state;
    next.mode = Mode::View;
    next.inputBuffer.clear();
    return next;
}

} // namespace

RouteResult InputRouter::Route(const InteractionState& state,
                               const std::vector<Task>& tasks,
                               const KeyEvent& key) {
    switch (state.mode) {
        case Mode::View:
            return RouteView(state, tasks, key);
        case Mode::AddInput:
        case Mode::EditInput:
        case Mode::SetTestCommand:
            return RouteInput(state, tasks, key);
    }
    return RouteResult{state, {}};
}

RouteResult InputRouter::RouteView(const InteractionState& state,
                                   const std::vector<Task>& tasks,
                                   const KeyEvent& key) {
    RouteResult result{state, {}};
    InteractionState& next = result.state;
    const std::size_t count = tasks.size();

    // Keep the selection valid even if the list shrank behind our back.
    ClampSelection(next, count);

    if (key.code == KeyCode::Down || (key.code == KeyCode::Char && key.ch == 'j')) {
        if (count > 0 && next.selectedIndex < count - 1) ++next.selectedIndex;
        return result;
    }
    if (key.code == KeyCode::Up || (key.code == KeyCode::Char && key.ch == 'k')) {
        if (next.selectedIndex > 0) --next.selectedIndex;
        return result;
    }
    if (key.code == KeyCode::Enter) {
        if (count > 0) result.effects.push_back(effects::CycleStatus{next.selectedIndex});
        return result;
    }
    if (key.code != KeyCode::Char) {
        return result;
    }

    switch (key.ch) {
        case 'q':
            result.effects.push_back(effects::Quit{});
            break;
        case 'd':
            if (count > 0) {
                result.effects.push_back(effects::DeleteTask{next.selectedIndex});
                if (next.selectedIndex == count - 1 && next.selectedIndex > 0) {
                    --next.selectedIndex;
                }
            }
            break;
        case 'a':
            next = EnterMode(next, Mode::AddInput, "");
            break;
        case 'e':
            if (count > 0) {
                next = EnterMode(next, Mode::EditInput, tasks[next.selectedIndex].description);
            }
            break;
        case 'T':
            next = EnterMode(next, Mode::SetTestCommand, next.testCommand);
            break;
        case 't':
            result.effects.push_back(effects::TestAndCommit{});
            break;
        case 'E':
            result.effects.push_back(effects::ExportTasks{});
            break;
        default:
            break;
    }
    return result;
}

RouteResult InputRouter::RouteInput(const InteractionState& state,
                                    const std::vector<Task>& tasks,
                                    const KeyEvent& key) {
    RouteResult result{state, {}};
    switch (key.code) {
        case KeyCode::Char:
            result.state.inputBuffer.push_back(key.ch);
            break;
        case KeyCode::Backspace:
            PopLastCharacter(result.state.inputBuffer);
            break;
        case KeyCode::Escape:
            result.state = BackToView(state);
            break;
        case KeyCode::Enter:
            return Confirm(state, tasks);
        case KeyCode::Up:
        case KeyCode::Down:
        case KeyCode::Other:
            break;
    }
    return result;
}

RouteResult InputRouter::Confirm(const InteractionState& state, const std::vector<Task>& tasks) {
    RouteResult result{state, {}};
    switch (state.mode) {
        case Mode::AddInput:
            if (domain::IsBlank(state.inputBuffer)) {
                // Stay in the input mode so the text can be corrected.
                result.effects.push_back(effects::Warn{kEmptyDescriptionWarning});
                return result;
            }
            result.effects.push_back(effects::AddTask{state.inputBuffer});
            result.state = BackToView(state);
            return result;
        case Mode::EditInput:
            if (state.selectedIndex >= tasks.size()) {
                result.state = BackToView(state);
                return result;
            }
            if (domain::IsBlank(state.inputBuffer)) {
                result.effects.push_back(effects::Warn{kEmptyDescriptionWarning});
                return result;
            }
            result.effects.push_back(effects::EditTask{state.selectedIndex, state.inputBuffer});
            result.state = BackToView(state);
            return result;
        case Mode::SetTestCommand:
            result.state = BackToView(state);
            result.state.testCommand = state.inputBuffer;
            return result;
        case Mode::View:
            break;
    }
    return result;
}

void InputRouter::ClampSelection(InteractionState& state, std::size_t count) {
    if (count == 0) state.selectedIndex = 0;
    else if (state.selectedIndex >= count) state.selectedIndex = count - 1;
}

void InputRouter::PopLastCharacter(std::string& buffer) {
    if (buffer.empty()) return;
    // Drop UTF-8 continuation bytes (10xxxxxx) together with their lead byte.
    while (buffer.size() > 1 && (static_cast<unsigned char>(buffer.back()) & 0xC0) == 0x80) {
        buffer.pop_back();
    }
    buffer.pop_back();
}

} // namespace taskwalker::application
