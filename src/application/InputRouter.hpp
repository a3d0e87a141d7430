/**
 * @file InputRouter.hpp
 * @brief Maps key events to interaction state transitions and effect requests.
 */

#pragma once

#include "domain/InteractionState.hpp"
#include "domain/Task.hpp"
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace taskwalker::application {

/**
 * @namespace effects
 * @brief Requests produced by the router and carried out by the run loop.
 */
namespace effects {

struct AddTask { std::string description; };
struct EditTask { std::size_t index; std::string description; };
struct DeleteTask { std::size_t index; };
struct CycleStatus { std::size_t index; };
struct ExportTasks {};
struct TestAndCommit {};
struct Warn { std::string message; };
struct Quit {};

} // namespace effects

using Effect = std::variant<
    effects::AddTask,
    effects::EditTask,
    effects::DeleteTask,
    effects::CycleStatus,
    effects::ExportTasks,
    effects::TestAndCommit,
    effects::Warn,
    effects::Quit>;

/**
 * @struct RouteResult
 * @brief Outcome of routing one key event.
 */
struct RouteResult {
    domain::InteractionState state; ///< State after the key.
    std::vector<Effect> effects;    ///< Mutations and side effects to apply, in order.
};

/**
 * @class InputRouter
 * @brief Pure transition function of the interaction state machine.
 *
 * The router never touches the task list. It reads the list only to clamp
 * the selection and to seed the edit buffer; every change is expressed as an
 * effect. Keys without a binding in the current mode produce the input state
 * unchanged and no effects.
 */
class InputRouter {
public:
    static constexpr const char* kEmptyDescriptionWarning = "Task description cannot be empty.";

    /**
     * @brief Routes a key event.
     * @param state Current interaction state.
     * @param tasks Current task list, read-only.
     * @param key The key pressed.
     */
    static RouteResult Route(const domain::InteractionState& state,
                             const std::vector<domain::Task>& tasks,
                             const domain::KeyEvent& key);

    /** @brief Pulls the selection back into [0, count-1], or 0 for an empty list. */
    static void ClampSelection(domain::InteractionState& state, std::size_t count);

    /** @brief Removes the last character (a whole UTF-8 sequence) from the buffer. */
    static void PopLastCharacter(std::string& buffer);

private:
    static RouteResult RouteView(const domain::InteractionState& state,
                                 const std::vector<domain::Task>& tasks,
                                 const domain::KeyEvent& key);
    static RouteResult RouteInput(const domain::InteractionState& state,
                                  const std::vector<domain::Task>& tasks,
                                  const domain::KeyEvent& key);
    static RouteResult Confirm(const domain::InteractionState& state,
                               const std::vector<domain::Task>& tasks);
};

} // namespace taskwalker::application
