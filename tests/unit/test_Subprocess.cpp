#include <gtest/gtest.h>
#include "process/Subprocess.hpp"
#include "process/PosixProcess.hpp"
#include "support/Fakes.hpp"

#include <mutex>
#include <thread>
#include <unistd.h>

using namespace bk::process;
using namespace std::chrono_literals;

namespace {
Command sh(const std::string& script) {
    return {"/bin/sh", {"-c", script}, {}};
}
}

TEST(SubprocessTest, CapturesStdoutStderrAndExitCode) {
    const auto res = runWithTimeout(sh("echo hello; echo oops >&2; exit 3"), 5s);
    EXPECT_EQ(res.code, 3);
    EXPECT_EQ(res.out, "hello\n");
    EXPECT_EQ(res.err, "oops\n");
    EXPECT_FALSE(res.timedOut);
    EXPECT_FALSE(res.ok());
}

TEST(SubprocessTest, RunsInWorkingDirectory) {
    bk::test::TempDir dir;
    auto cmd = sh("pwd");
    cmd.workingDir = dir.path();
    const auto res = runWithTimeout(cmd, 5s);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(std::filesystem::canonical(res.out.substr(0, res.out.size() - 1)),
              std::filesystem::canonical(dir.path()));
}

TEST(SubprocessTest, TimeoutKillsTheChild) {
    const auto started = std::chrono::steady_clock::now();
    const auto res = runWithTimeout(sh("sleep 30"), 300ms);
    EXPECT_TRUE(res.timedOut);
    EXPECT_FALSE(res.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(SubprocessTest, MissingExecutableIsNotAnException) {
    const auto res = runWithTimeout({"/nonexistent/basekeeper-binary", {}, {}}, 5s);
    EXPECT_FALSE(res.ok());
}

TEST(SubprocessTest, CommandToStringJoinsArgs) {
    const Command cmd{"/opt/pb", {"migrate", "up", "--dir", "pb_data"}, {}};
    EXPECT_EQ(cmd.toString(), "/opt/pb migrate up --dir pb_data");
}

class PosixProcessTest : public ::testing::Test {
protected:
    std::mutex mutex;
    std::vector<std::pair<OutputStream, std::string>> lines;

    LineHandler collector() {
        return [this](const OutputStream s, const std::string& l) {
            std::scoped_lock lock(mutex);
            lines.emplace_back(s, l);
        };
    }

    bool waitFor(const std::function<bool()>& pred, const std::chrono::milliseconds limit = 5s) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(20ms);
        }
        return pred();
    }
};

TEST_F(PosixProcessTest, StreamsLinesFromBothPipes) {
    auto child = PosixProcess::spawn(sh("echo one; echo two >&2; printf tail"), collector());
    ASSERT_TRUE(waitFor([&] { return !child->isRunning(); }));
    ASSERT_TRUE(waitFor([&] { std::scoped_lock l(mutex); return lines.size() >= 3; }));

    EXPECT_EQ(child->exitCode(), 0);
    EXPECT_EQ(child->state(), ProcessState::Stopped);

    std::scoped_lock lock(mutex);
    EXPECT_NE(std::find(lines.begin(), lines.end(), std::make_pair(OutputStream::Stdout, std::string("one"))), lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), std::make_pair(OutputStream::Stderr, std::string("two"))), lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), std::make_pair(OutputStream::Stdout, std::string("tail"))), lines.end());
}

TEST_F(PosixProcessTest, ReportsNonZeroExit) {
    auto child = PosixProcess::spawn(sh("exit 4"), collector());
    ASSERT_TRUE(waitFor([&] { return !child->isRunning(); }));
    EXPECT_EQ(child->exitCode(), 4);
}

TEST_F(PosixProcessTest, TerminateStopsALongRunningChild) {
    auto child = PosixProcess::spawn(sh("sleep 30"), collector());
    EXPECT_TRUE(child->isRunning());
    child->terminate(2s);
    EXPECT_FALSE(child->isRunning());
    EXPECT_EQ(child->state(), ProcessState::Stopped);
}

TEST_F(PosixProcessTest, TerminateEscalatesToKill) {
    auto child = PosixProcess::spawn(sh("trap '' TERM; sleep 30"), collector());
    std::this_thread::sleep_for(100ms);
    const auto started = std::chrono::steady_clock::now();
    child->terminate(300ms);
    EXPECT_FALSE(child->isRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(PosixProcessTest, ChildRunsInItsOwnProcessGroup) {
    auto child = PosixProcess::spawn(sh("sleep 5"), collector());
    ASSERT_TRUE(child->isRunning());
    EXPECT_EQ(::getpgid(child->pid()), child->pid());
    EXPECT_NE(::getpgid(child->pid()), ::getpgid(0));
    child->terminate(2s);
}

TEST_F(PosixProcessTest, SpawnFailureThrows) {
    EXPECT_THROW(PosixProcess::spawn({"/nonexistent/basekeeper-binary", {}, {}}, collector()), std::runtime_error);
}
