/**
 * @file UiRenderer.hpp
 * @brief Draws the task list, the input box and the status line with curses.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/Task.hpp"
#include "ui/AppState.hpp"

namespace taskwalker::ui {

/** @brief Curses color pair ids, initialized by TerminalSession. */
constexpr short kColorSelected = 1;
constexpr short kColorInput = 2;
constexpr short kColorWarning = 3;

/**
 * @class UiRenderer
 * @brief Renders one frame from the current state.
 */
class UiRenderer {
public:
    static constexpr const char* kHelpTitle =
        "Tasks (Enter: toggle, a: add, e: edit, d: delete, T: set test, t: test+commit, E: export, q: quit)";

    explicit UiRenderer(bool useColors) : m_useColors(useColors) {}

    /** @brief Draws a full frame. Updates state.listScroll to keep the selection visible. */
    void Draw(AppState& state, const std::vector<domain::Task>& tasks);

    /** @brief "[ ] desc", "[working] desc" or "[done] desc". */
    static std::string FormatTaskLine(const domain::Task& task);

    /** @brief Title of the input box for an input mode, empty for View. */
    static std::string InputTitle(domain::Mode mode);

    /**
     * @brief Computes the first visible row so the selected row is on screen.
     * @param previous Scroll offset of the last frame.
     * @param selected Selected row.
     * @param count Number of rows.
     * @param visibleRows Rows that fit in the list box.
     */
    static std::size_t ScrollOffset(std::size_t previous, std::size_t selected,
                                    std::size_t count, std::size_t visibleRows);

private:
    void DrawBox(int top, int left, int height, int width, const std::string& title);

    bool m_useColors;
};

} // namespace taskwalker::ui
