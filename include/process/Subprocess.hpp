#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace bk::process {

struct Command {
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::filesystem::path workingDir;   // empty = inherit

    [[nodiscard]] std::string toString() const;
};

struct ProcessResult {
    int code = -1;          // exit status, -1 when killed by a signal or never started
    std::string out;
    std::string err;
    bool timedOut = false;

    [[nodiscard]] bool ok() const { return code == 0; }
};

// Runs cmd to completion, capturing stdout/stderr. On timeout the child gets
// SIGTERM, then SIGKILL one second later. Never throws; spawn failures come
// back as code -1 with the reason in err.
ProcessResult runWithTimeout(const Command& cmd, std::chrono::milliseconds timeout);

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual ProcessResult run(const Command& cmd, std::chrono::milliseconds timeout) = 0;
};

class SubprocessRunner final : public CommandRunner {
public:
    ProcessResult run(const Command& cmd, const std::chrono::milliseconds timeout) override {
        return runWithTimeout(cmd, timeout);
    }
};

}
