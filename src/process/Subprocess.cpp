#include "process/Subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <vector>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace bk::process;

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto KILL_GRACE = std::chrono::seconds(1);

void closeFd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

// Reads what is available; returns false once the stream hit EOF or failed.
bool drain(const int fd, std::string& into) {
    std::array<char, 4096> buf{};
    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
        into.append(buf.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

int decodeStatus(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

}

std::string Command::toString() const {
    std::string s = executable.string();
    for (const auto& a : args) s += " " + a;
    return s;
}

ProcessResult bk::process::runWithTimeout(const Command& cmd, const std::chrono::milliseconds timeout) {
    ProcessResult result;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) == -1 || ::pipe2(errPipe, O_CLOEXEC) == -1) {
        result.err = std::string("Failed to create pipes: ") + std::strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        return result;
    }

    // Build argv before forking; only async-signal-safe calls happen in the child.
    const std::string exe = cmd.executable.string();
    const std::string cwd = cmd.workingDir.string();
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& a : cmd.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.err = std::string("Failed to fork: ") + std::strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(126);
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(exe.c_str(), argv.data());
        static constexpr char msg[] = "exec failed\n";
        [[maybe_unused]] const auto w = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127); // exec failed
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    const auto deadline = Clock::now() + timeout;
    std::optional<Clock::time_point> killAt;
    bool killed = false;

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        const auto now = Clock::now();

        if (!result.timedOut && now >= deadline) {
            result.timedOut = true;
            ::kill(pid, SIGTERM);
            killAt = now + KILL_GRACE;
        }
        if (killAt && !killed && now >= *killAt) {
            ::kill(pid, SIGKILL);
            killed = true;
        }
        // A grandchild may still hold the pipes after the kill; stop waiting on them.
        if (killed && now >= *killAt + KILL_GRACE) break;

        std::array<pollfd, 2> fds{};
        nfds_t n = 0;
        if (outPipe[0] >= 0) fds[n++] = {outPipe[0], POLLIN, 0};
        if (errPipe[0] >= 0) fds[n++] = {errPipe[0], POLLIN, 0};

        const int rc = ::poll(fds.data(), n, 100);
        if (rc < 0 && errno != EINTR) {
            ::kill(pid, SIGKILL);
            killed = true;
            break;
        }
        if (rc <= 0) continue;

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == outPipe[0]) {
                if (!drain(outPipe[0], result.out)) closeFd(outPipe[0]);
            } else if (fds[i].fd == errPipe[0]) {
                if (!drain(errPipe[0], result.err)) closeFd(errPipe[0]);
            }
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    result.code = waited == pid ? decodeStatus(status) : -1;
    return result;
}
