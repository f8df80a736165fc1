#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>
#include "common/command_runner.hpp"

// Replays scripted results. A response registered for "<command> <first arg>"
// wins over one registered for the bare command; unscripted calls succeed
// with empty output.
class FakeCommandRunner : public CommandRunner {
public:
    struct Call {
        std::string command;
        std::vector<std::string> args;

        std::string line() const { return formatCommand(command, args); }
    };

    std::vector<Call> calls;

    void respond(const std::string& key, ExecResult result) {
        responses_[key].push_back(std::move(result));
    }

    void respond(const std::string& key, int exitCode, const std::string& out, const std::string& err = "") {
        ExecResult result;
        result.exitCode = exitCode;
        result.stdoutOutput = out;
        result.stderrOutput = err;
        respond(key, result);
    }

    ExecResult run(const std::string& command, const std::vector<std::string>& args) override {
        calls.push_back({command, args});
        if (!args.empty()) {
            ExecResult scripted;
            if (take(command + " " + args.front(), scripted)) {
                return scripted;
            }
        }
        ExecResult scripted;
        if (take(command, scripted)) {
            return scripted;
        }
        ExecResult ok;
        ok.exitCode = 0;
        return ok;
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        for (const auto& call : calls) {
            out.push_back(call.line());
        }
        return out;
    }

private:
    // The last response for a key is sticky.
    bool take(const std::string& key, ExecResult& result) {
        auto it = responses_.find(key);
        if (it == responses_.end() || it->second.empty()) {
            return false;
        }
        result = it->second.front();
        if (it->second.size() > 1) {
            it->second.pop_front();
        }
        return true;
    }

    std::map<std::string, std::deque<ExecResult>> responses_;
};
