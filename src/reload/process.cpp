/// @file process.cpp
/// @brief POSIX child process execution

#include "process.hpp"

#include <array>
#include <cerrno>

#include <sys/wait.h>
#include <unistd.h>

namespace devloop_reload::detail {

ProcessResult execute_process(const std::string& command, const std::vector<std::string>& args) {
    ProcessResult result;

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        return result;
    }

    pid_t pid = fork();
    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(command.c_str()));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    close(out_pipe[1]);
    if (pid < 0) {
        close(out_pipe[0]);
        return result;
    }
    result.launched = true;

    std::array<char, 4096> buffer;
    for (;;) {
        ssize_t n = read(out_pipe[0], buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<std::size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(out_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127) {
            result.launched = false;
        }
    }
    return result;
}

} // namespace devloop_reload::detail
