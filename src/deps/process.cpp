#include "topojar/installer.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace topojar {

std::string Command::to_string() const {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        line += arg;
    }
    return line;
}

ExecResult run_command(const Command& command) {
    ExecResult result;

    if (command.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    // Build C-style argv before forking
    std::vector<char*> argv;
    for (const auto& s : command.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    spdlog::debug("running '{}' in {}", command.to_string(), command.cwd);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on
        if (!command.cwd.empty() && chdir(command.cwd.c_str()) != 0) {
            _exit(127);
        }

        switch (command.output) {
            case OutputTarget::Discard: {
                int devnull = open("/dev/null", O_WRONLY);
                if (devnull < 0 || dup2(devnull, STDOUT_FILENO) < 0) {
                    _exit(127);
                }
                close(devnull);
                break;
            }
            case OutputTarget::Stderr:
                if (dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
                    _exit(127);
                }
                break;
            case OutputTarget::Stdout:
                break;
        }
        if (dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
            _exit(127);
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

} // namespace topojar
