/**
 * @file AppState.cpp
 * @brief Implementation of AppState helpers.
 */
#include "ui/AppState.hpp"

namespace taskwalker::ui {

void AppState::AppendLog(const std::string& line) {
    statusMessage = line;
    statusIsWarning = false;
}

void AppState::Warn(const std::string& message) {
    AppendLog("[WARN] " + message);
    statusIsWarning = true;
}

void AppState::ClearStatus() {
    statusMessage.clear();
    statusIsWarning = false;
}

} // namespace taskwalker::ui
