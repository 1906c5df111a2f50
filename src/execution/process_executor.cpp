#include "execution/process_executor.hpp"

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace provision {

namespace {

constexpr int exec_failure_exit_code = 127;

[[nodiscard]] std::vector<char *> build_argv(const Command &command) {
    std::vector<char *> argv;
    argv.reserve(command.args.size() + 2);

    argv.push_back(const_cast<char *>(command.program.c_str()));
    for (const auto &arg : command.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    return argv;
}

} // namespace

int ProcessExecutor::run(const Command &command) const {
    const pid_t pid = fork();
    if (pid == -1) {
        throw std::runtime_error("fork failed");
    }

    if (pid == 0) {
        execute_in_child(command);
    }

    return wait_for_process(pid);
}

int ProcessExecutor::run(const Command &command, const OutputSink &sink) const {
    int output_pipe[2];
    if (pipe(output_pipe) == -1) {
        throw std::runtime_error("pipe failed");
    }

    const pid_t pid = fork();
    if (pid == -1) {
        close(output_pipe[0]);
        close(output_pipe[1]);
        throw std::runtime_error("fork failed");
    }

    if (pid == 0) {
        close(output_pipe[0]);
        dup2(output_pipe[1], STDOUT_FILENO);
        dup2(output_pipe[1], STDERR_FILENO);
        close(output_pipe[1]);

        execute_in_child(command);
    }

    close(output_pipe[1]);

    try {
        char buf[4096];
        while (true) {
            const ssize_t n = read(output_pipe[0], buf, sizeof(buf));
            if (n > 0) {
                sink(std::string_view(buf, static_cast<std::size_t>(n)));
                continue;
            }

            if (n == -1 && errno == EINTR) {
                continue;
            }

            break;
        }
    } catch (...) {
        // Closing the read end lets a still-writing child die on SIGPIPE before it is reaped.
        close(output_pipe[0]);
        (void)wait_for_process(pid);
        throw;
    }
    close(output_pipe[0]);

    return wait_for_process(pid);
}

CommandResult ProcessExecutor::capture(const Command &command) const {
    CommandResult result;
    result.exit_code = run(command, [&result](std::string_view chunk) { result.output.append(chunk); });
    return result;
}

void ProcessExecutor::execute_in_child(const Command &command) noexcept {
    auto argv = build_argv(command);
    execvp(command.program.c_str(), argv.data());
    std::perror("exec failed");
    _exit(exec_failure_exit_code);
}

int ProcessExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error("waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

int ProcessExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

} // namespace provision
