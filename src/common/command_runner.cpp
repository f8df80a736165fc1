#include "common/command_runner.hpp"
#include "common/logger.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}  // namespace

std::string formatCommand(const std::string& command, const std::vector<std::string>& args) {
    std::string line = command;
    for (const auto& arg : args) {
        line += " " + arg;
    }
    return line;
}

ExecResult ProcessCommandRunner::run(const std::string& command, const std::vector<std::string>& args) {
    ExecResult result;
    Logger::debug("Running: " + formatCommand(command, args));

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    if (pipe(stdoutPipe) < 0) {
        result.stderrOutput = std::string("Failed to create pipe: ") + strerror(errno);
        return result;
    }
    if (pipe(stderrPipe) < 0) {
        result.stderrOutput = std::string("Failed to create pipe: ") + strerror(errno);
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderrOutput = std::string("Fork failed: ") + strerror(errno);
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        return result;
    }

    if (pid == 0) {
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        close(stderrPipe[0]);
        close(stderrPipe[1]);
        execvp(command.c_str(), argv.data());
        _exit(127);  // exec failed
    }

    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    // Drain both pipes together so a chatty stderr cannot block the child.
    std::array<char, 4096> buffer;
    std::array<pollfd, 2> fds = {{{stdoutPipe[0], POLLIN, 0}, {stderrPipe[0], POLLIN, 0}}};
    std::string* sinks[2] = {&result.stdoutOutput, &result.stderrOutput};
    int openStreams = 2;
    while (openStreams > 0) {
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            close(fd.fd);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.stderrOutput += std::string("waitpid failed: ") + strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    if (result.exitCode == 127 && result.stdoutOutput.empty() && result.stderrOutput.empty()) {
        result.stderrOutput = "Command not found: " + command;
    }
    return result;
}
