/**
 * @file UiRenderer.cpp
 * @brief Implementation of the curses frame renderer.
 */
#include "ui/UiRenderer.hpp"

#include <algorithm>
#include <ncurses.h>

namespace taskwalker::ui {

namespace {

constexpr int kMargin = 1;
constexpr int kInputHeight = 3;

} // namespace

std::string UiRenderer::FormatTaskLine(const domain::Task& task) {
    switch (task.status) {
        case domain::TaskStatus::Done: return "[done] " + task.description;
        case domain::TaskStatus::Working: return "[working] " + task.description;
        case domain::TaskStatus::Pending: return "[ ] " + task.description;
    }
    return "[ ] " + task.description;
}

std::string UiRenderer::InputTitle(domain::Mode mode) {
    switch (mode) {
        case domain::Mode::AddInput: return "Enter task description";
        case domain::Mode::EditInput: return "Edit task description";
        case domain::Mode::SetTestCommand: return "Enter test command (used by 't')";
        case domain::Mode::View: return "";
    }
    return "";
}

std::size_t UiRenderer::ScrollOffset(std::size_t previous, std::size_t selected,
                                     std::size_t count, std::size_t visibleRows) {
    if (visibleRows == 0 || count <= visibleRows) return 0;
    std::size_t offset = previous;
    if (selected < offset) offset = selected;
    if (selected >= offset + visibleRows) offset = selected - visibleRows + 1;
    return std::min(offset, count - visibleRows);
}

void UiRenderer::DrawBox(int top, int left, int height, int width, const std::string& title) {
    if (height < 2 || width < 2) return;
    int bottom = top + height - 1;
    int right = left + width - 1;

    mvhline(top, left + 1, ACS_HLINE, width - 2);
    mvhline(bottom, left + 1, ACS_HLINE, width - 2);
    mvvline(top + 1, left, ACS_VLINE, height - 2);
    mvvline(top + 1, right, ACS_VLINE, height - 2);
    mvaddch(top, left, ACS_ULCORNER);
    mvaddch(top, right, ACS_URCORNER);
    mvaddch(bottom, left, ACS_LLCORNER);
    mvaddch(bottom, right, ACS_LRCORNER);

    if (!title.empty() && width > 4) {
        mvaddnstr(top, left + 1, title.c_str(), width - 2);
    }
}

void UiRenderer::Draw(AppState& state, const std::vector<domain::Task>& tasks) {
    erase();

    int rows = LINES;
    int cols = COLS;
    int width = cols - 2 * kMargin;
    int statusRow = rows - 1;
    int inputTop = statusRow - kInputHeight;
    int listTop = kMargin;
    int listHeight = inputTop - listTop;

    if (width >= 4 && listHeight >= 3) {
        DrawBox(listTop, kMargin, listHeight, width, kHelpTitle);

        std::size_t visible = static_cast<std::size_t>(listHeight - 2);
        const auto& interaction = state.interaction;
        state.listScroll = ScrollOffset(state.listScroll, interaction.selectedIndex, tasks.size(), visible);

        for (std::size_t row = 0; row < visible; ++row) {
            std::size_t index = state.listScroll + row;
            if (index >= tasks.size()) break;

            bool selected = (index == interaction.selectedIndex);
            attr_t attrs = selected ? A_BOLD : A_NORMAL;
            if (selected && m_useColors) attrs |= COLOR_PAIR(kColorSelected);
            if (selected && !m_useColors) attrs |= A_REVERSE;

            attron(attrs);
            mvaddnstr(listTop + 1 + static_cast<int>(row), kMargin + 1,
                      FormatTaskLine(tasks[index]).c_str(), width - 2);
            attroff(attrs);
        }
    }

    bool inputMode = domain::IsInputMode(state.interaction.mode);
    if (inputMode && width >= 4 && inputTop > 0) {
        DrawBox(inputTop, kMargin, kInputHeight, width, InputTitle(state.interaction.mode));

        const std::string& buffer = state.interaction.inputBuffer;
        int room = width - 3;
        // Keep the end of the buffer, where the cursor is, in view.
        std::size_t start = buffer.size() > static_cast<std::size_t>(room) ? buffer.size() - room : 0;
        if (m_useColors) attron(COLOR_PAIR(kColorInput));
        mvaddnstr(inputTop + 1, kMargin + 1, buffer.c_str() + start, room);
        if (m_useColors) attroff(COLOR_PAIR(kColorInput));
    }

    if (!state.statusMessage.empty() && statusRow >= 0) {
        attr_t attrs = state.statusIsWarning ? A_BOLD : A_NORMAL;
        if (state.statusIsWarning && m_useColors) attrs |= COLOR_PAIR(kColorWarning);
        attron(attrs);
        mvaddnstr(statusRow, kMargin, state.statusMessage.c_str(), std::max(0, cols - 2 * kMargin));
        attroff(attrs);
    }

    if (inputMode) {
        curs_set(1);
        int x = kMargin + 1 + static_cast<int>(std::min<std::size_t>(state.interaction.inputBuffer.size(),
                                                                       static_cast<std::size_t>(std::max(0, width - 3))));
        move(inputTop + 1, x);
    } else {
        curs_set(0);
    }
    refresh();
}

} // namespace taskwalker::ui
