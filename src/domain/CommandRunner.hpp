/**
 * @file CommandRunner.hpp
 * @brief Interface for running external programs synchronously.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace taskwalker::domain {

/**
 * @class CommandRunner
 * @brief Abstract interface for launching a program and waiting for it to finish.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs argv[0] with the remaining elements as arguments. No shell is involved.
     * @param argv Program name followed by its arguments. Must not be empty.
     * @return The exit code, or std::nullopt if the program could not be started
     *         or did not exit normally.
     */
    virtual std::optional<int> run(const std::vector<std::string>& argv) = 0;
};

} // namespace taskwalker::domain
