/**
 * @file PosixCommandRunner.cpp
 * @brief Implementation of PosixCommandRunner.
 */

#include "infrastructure/PosixCommandRunner.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace taskwalker::infrastructure {

std::optional<int> PosixCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::nullopt;

    int errPipe[2];
    if (pipe(errPipe) == -1) {
        std::cerr << "[PosixCommandRunner] pipe failed: " << std::strerror(errno) << std::endl;
        return std::nullopt;
    }
    fcntl(errPipe[1], F_SETFD, FD_CLOEXEC);

    // Anything buffered would otherwise be duplicated into the child.
    std::cout.flush();
    std::fflush(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        std::cerr << "[PosixCommandRunner] fork failed: " << std::strerror(errno) << std::endl;
        close(errPipe[0]);
        close(errPipe[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child process
        close(errPipe[0]);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            args.push_back(const_cast<char*>(a.c_str()));
        }
        args.push_back(nullptr);

        execvp(args[0], args.data());

        int execErrno = errno;
        ssize_t ignored = write(errPipe[1], &execErrno, sizeof(execErrno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(errPipe[1]);

    int execErrno = 0;
    ssize_t n;
    do {
        n = read(errPipe[0], &execErrno, sizeof(execErrno));
    } while (n == -1 && errno == EINTR);
    close(errPipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        std::cerr << "[PosixCommandRunner] Cannot run '" << argv[0] << "': " << std::strerror(execErrno) << std::endl;
        return std::nullopt;
    }
    if (waited == -1) {
        std::cerr << "[PosixCommandRunner] waitpid failed: " << std::strerror(errno) << std::endl;
        return std::nullopt;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return std::nullopt;
}

} // namespace taskwalker::infrastructure
