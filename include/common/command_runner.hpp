#pragma once

#include <string>
#include <vector>

struct ExecResult {
    int exitCode{-1};
    std::string stdoutOutput;
    std::string stderrOutput;

    bool succeeded() const { return exitCode == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs command with args passed verbatim (no shell) and captures both streams.
    virtual ExecResult run(const std::string& command, const std::vector<std::string>& args) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    ExecResult run(const std::string& command, const std::vector<std::string>& args) override;
};

std::string formatCommand(const std::string& command, const std::vector<std::string>& args);
