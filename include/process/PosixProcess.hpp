#pragma once

#include "process/ChildProcess.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <sys/types.h>

namespace bk::process {

class OutputPump;

class PosixProcess final : public ChildProcess {
public:
    // Forks and execs cmd with stdout/stderr piped into onLine. Throws std::runtime_error on failure.
    static std::unique_ptr<PosixProcess> spawn(const Command& cmd, LineHandler onLine);

    ~PosixProcess() override;

    [[nodiscard]] ProcessState state() const override { return state_.load(); }
    [[nodiscard]] bool isRunning() override;
    [[nodiscard]] std::optional<int> exitCode() const override;
    void terminate(std::chrono::milliseconds grace) override;

    [[nodiscard]] pid_t pid() const { return pid_; }

private:
    explicit PosixProcess(pid_t pid);

    pid_t pid_;
    std::atomic<ProcessState> state_{ProcessState::Starting};
    std::optional<int> exitCode_;
    mutable std::mutex mutex_;
    std::unique_ptr<OutputPump> pump_;

    bool reap(bool block);
    void awaitExitAfterStreamsClosed();
};

class PosixProcessLauncher final : public ProcessLauncher {
public:
    std::unique_ptr<ChildProcess> launch(const Command& cmd, LineHandler onLine) override {
        return PosixProcess::spawn(cmd, std::move(onLine));
    }
};

}
