/**
 * @file AppState.hpp
 * @brief Run-loop state shared by the renderer and the input handling.
 */

#pragma once

#include <cstddef>
#include <string>

#include "domain/InteractionState.hpp"

namespace taskwalker::ui {

/**
 * @struct AppState
 * @brief Everything the loop mutates besides the task list itself.
 *
 * Owned by TaskWalkerApp and passed by reference to the renderer; there is
 * no global instance.
 */
struct AppState {
    domain::InteractionState interaction; ///< Mode, selection, buffers.
    std::string statusMessage;            ///< Shown on the bottom line.
    bool statusIsWarning = false;         ///< Highlights the status line.
    bool requestExit = false;             ///< Set by the quit key.
    std::size_t listScroll = 0;           ///< First visible row of the task list.

    /** @brief Shows an informational line on the status line until the next key. */
    void AppendLog(const std::string& line);
    /** @brief Shows a warning on the status line until the next key. */
    void Warn(const std::string& message);
    /** @brief Clears the status line. */
    void ClearStatus();
};

} // namespace taskwalker::ui
