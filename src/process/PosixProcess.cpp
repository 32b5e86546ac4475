#include "process/PosixProcess.hpp"
#include "process/OutputPump.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace bk::process;
using namespace bk::log;

namespace {

constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(50);

void closePair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) ::close(fds[i]);
        fds[i] = -1;
    }
}

}

std::unique_ptr<PosixProcess> PosixProcess::spawn(const Command& cmd, LineHandler onLine) {
    int outPipe[2] = {-1, -1}, errPipe[2] = {-1, -1}, execPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) == -1 || ::pipe2(errPipe, O_CLOEXEC) == -1 || ::pipe2(execPipe, O_CLOEXEC) == -1) {
        const int err = errno;
        closePair(outPipe); closePair(errPipe); closePair(execPipe);
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    const std::string exe = cmd.executable.string();
    const std::string cwd = cmd.workingDir.string();
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& a : cmd.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closePair(outPipe); closePair(errPipe); closePair(execPipe);
        throw std::runtime_error(std::string("Failed to fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        int err = 0;
        // Own process group so a terminal SIGINT reaches only the supervisor
        if (::setpgid(0, 0) != 0) err = errno;
        if (!err && !cwd.empty() && ::chdir(cwd.c_str()) != 0) err = errno;
        if (!err) {
            const int devNull = ::open("/dev/null", O_RDONLY);
            if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::execvp(exe.c_str(), argv.data());
            err = errno;
        }
        // Parent learns about the failure through the close-on-exec pipe
        [[maybe_unused]] const auto w = ::write(execPipe[1], &err, sizeof(err));
        _exit(127);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(execPipe[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        throw std::runtime_error("Failed to execute " + exe + ": " + std::strerror(childErr));
    }

    std::unique_ptr<PosixProcess> proc(new PosixProcess(pid));
    auto* raw = proc.get();
    proc->pump_ = std::make_unique<OutputPump>(outPipe[0], errPipe[0], std::move(onLine),
                                               [raw] { raw->awaitExitAfterStreamsClosed(); });
    proc->state_.store(ProcessState::Running);
    proc->pump_->start();

    Registry::backend()->debug("[PosixProcess] Spawned pid {}: {}", pid, cmd.toString());
    return proc;
}

PosixProcess::PosixProcess(const pid_t pid) : pid_(pid) {}

PosixProcess::~PosixProcess() {
    if (isRunning()) terminate(std::chrono::seconds(5));
    pump_.reset();
}

bool PosixProcess::isRunning() {
    if (state_.load() == ProcessState::Stopped) return false;
    return !reap(false);
}

std::optional<int> PosixProcess::exitCode() const {
    std::scoped_lock lock(mutex_);
    return exitCode_;
}

void PosixProcess::terminate(const std::chrono::milliseconds grace) {
    if (!isRunning()) return;

    state_.store(ProcessState::Stopping);
    ::kill(pid_, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) break;
        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }

    if (!reap(false)) {
        Registry::backend()->warn("[PosixProcess] Force killing backend process (pid {})", pid_);
        ::kill(pid_, SIGKILL);
        reap(true);
    }

    if (pump_) pump_->stop();
}

bool PosixProcess::reap(const bool block) {
    std::scoped_lock lock(mutex_);
    if (exitCode_) return true;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) return false;

    const bool stopping = state_.load() == ProcessState::Stopping;
    if (r < 0) exitCode_ = -1;
    else if (WIFEXITED(status)) exitCode_ = WEXITSTATUS(status);
    else exitCode_ = WIFSIGNALED(status) ? -WTERMSIG(status) : -1;

    state_.store(ProcessState::Stopped);

    if (*exitCode_ == 0 || (stopping && *exitCode_ < 0)) Registry::backend()->info("Backend stopped");
    else Registry::backend()->error("Backend exited with code {}", *exitCode_);

    return true;
}

void PosixProcess::awaitExitAfterStreamsClosed() {
    while (!reap(false)) {
        if (state_.load() == ProcessState::Stopped) return;
        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
}
