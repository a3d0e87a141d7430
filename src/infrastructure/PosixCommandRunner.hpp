/**
 * @file PosixCommandRunner.hpp
 * @brief fork/execvp implementation of the CommandRunner.
 */

#pragma once
#include "domain/CommandRunner.hpp"

namespace taskwalker::infrastructure {

/**
 * @class PosixCommandRunner
 * @brief Runs programs in the foreground, inheriting stdin/stdout/stderr.
 *
 * The program is looked up on PATH. Exec failures are reported back to the
 * parent through a close-on-exec pipe, so "not found" is distinguished from
 * a program that exits with 127.
 */
class PosixCommandRunner : public domain::CommandRunner {
public:
    std::optional<int> run(const std::vector<std::string>& argv) override;
};

} // namespace taskwalker::infrastructure
