#pragma once

#include "process/OutputFilter.hpp"
#include "process/Subprocess.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace bk::process {

enum class ProcessState { Stopped, Starting, Running, Stopping };

using LineHandler = std::function<void(OutputStream, const std::string&)>;

// Exclusive handle to the one long-running child.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    [[nodiscard]] virtual ProcessState state() const = 0;

    // Reaps the child if it has exited.
    [[nodiscard]] virtual bool isRunning() = 0;

    [[nodiscard]] virtual std::optional<int> exitCode() const = 0;

    // SIGTERM, then SIGKILL once `grace` has elapsed without an exit.
    virtual void terminate(std::chrono::milliseconds grace) = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Throws std::runtime_error when the process cannot be started.
    virtual std::unique_ptr<ChildProcess> launch(const Command& cmd, LineHandler onLine) = 0;
};

}
