#include <gtest/gtest.h>
#include "runtime/ProcessSupervisor.hpp"
#include "config/ConfigStore.hpp"
#include "support/Fakes.hpp"

#include <algorithm>
#include <fstream>
#include <thread>

using namespace bk::runtime;
using namespace bk::test;
using namespace std::chrono_literals;
using bk::config::Config;
using bk::config::ConfigStore;

class ProcessSupervisorTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeRunner runner;
    FakeLauncher launcher;
    FakeIpDetector ipDetector;
    FakeHealthChecker health;
    FakeBackupApi liveBackups;
    FakeBackupApi offlineBackups;
    FakeSettingsApi settings;
    std::atomic<int> authCalls{0};
    bool authSucceeds = true;

    void SetUp() override {
        std::filesystem::create_directories(dir.path() / "bin");
        std::ofstream(dir.path() / "bin" / "pocketbase-linux") << "#!/bin/sh\n";
    }

    static Config baseConfig() {
        Config cfg;
        cfg.superuser = {"admin@example.com", "password123"};
        return cfg;
    }

    std::unique_ptr<ProcessSupervisor> make(ConfigStore& store) {
        ProcessSupervisor::Options opts;
        opts.resourceDir = dir.path();
        opts.settleDelay = 10ms;
        opts.readinessTimeout = 500ms;
        opts.settingsDelay = 0ms;
        opts.stopGrace = 100ms;
        opts.authRetry = {3, 1ms, 2ms};

        return std::make_unique<ProcessSupervisor>(ProcessSupervisor::Collaborators{
            .store = store,
            .runner = runner,
            .launcher = launcher,
            .ipDetector = ipDetector,
            .health = health,
            .liveBackups = liveBackups,
            .settings = settings,
            .authenticate = [this](const ServerReady&, const std::string&, const std::string&) {
                ++authCalls;
                if (!authSucceeds) throw std::runtime_error("HTTP 400: Failed to authenticate.");
            },
            .offlineBackups = &offlineBackups,
        }, opts);
    }

    static bool contains(const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    }
};

TEST_F(ProcessSupervisorTest, InvalidConfigNeverSpawns) {
    auto cfg = baseConfig();
    cfg.server.port = 0;
    cfg.backup.keep_last = -1;
    cfg.advanced.smtp.enabled = true;
    ConfigStore store(dir.path() / "config.yaml", cfg);
    auto sup = make(store);

    const auto status = sup->start();
    EXPECT_EQ(status.errors.size(), 3u);
    EXPECT_TRUE(contains(status.errors, "Invalid port: 0 (must be 1-65535)"));
    EXPECT_TRUE(contains(status.errors, "backup.keep_last must be >= 0"));
    EXPECT_TRUE(contains(status.errors, "SMTP enabled but Host is empty"));
    EXPECT_TRUE(launcher.launched.empty());
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_FALSE(sup->running());
}

TEST_F(ProcessSupervisorTest, PortAboveRangeIsRejected) {
    auto cfg = baseConfig();
    cfg.server.port = 70000;
    ConfigStore store(dir.path() / "config.yaml", cfg);
    const auto status = make(store)->start();
    EXPECT_TRUE(contains(status.errors, "Invalid port: 70000 (must be 1-65535)"));
    EXPECT_TRUE(launcher.launched.empty());
}

TEST_F(ProcessSupervisorTest, MissingBinaryIsFatal) {
    auto cfg = baseConfig();
    cfg.advanced.binary = "bin/does-not-exist";
    ConfigStore store(dir.path() / "config.yaml", cfg);

    const auto status = make(store)->start();
    ASSERT_EQ(status.errors.size(), 1u);
    EXPECT_NE(status.errors[0].find("executable not found"), std::string::npos);
    EXPECT_TRUE(launcher.launched.empty());
}

TEST_F(ProcessSupervisorTest, InternalStartupBindsLoopback) {
    ConfigStore store(dir.path() / "config.yaml", baseConfig());
    auto sup = make(store);

    const auto status = sup->start();
    EXPECT_TRUE(status.errors.empty());
    EXPECT_EQ(status.bindAddress, "127.0.0.1:8090");
    EXPECT_EQ(status.publicUrl, "http://localhost:8090");
    EXPECT_EQ(status.clientAuthenticated, true);
    EXPECT_FALSE(status.healthCheckPassed.has_value());
    EXPECT_TRUE(health.probed.empty());
    EXPECT_EQ(ipDetector.calls, 0);
    EXPECT_EQ(status.executable, dir.path() / "bin" / "pocketbase-linux");

    ASSERT_EQ(launcher.launched.size(), 1u);
    const auto& cmd = launcher.launched[0];
    EXPECT_EQ(cmd.workingDir, dir.path());
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"serve", "--http=127.0.0.1:8090", "--dir=pb_data",
                                                  "--publicDir=pb_public"}));

    const auto perms = std::filesystem::status(status.executable).permissions();
    EXPECT_NE(perms & std::filesystem::perms::owner_exec, std::filesystem::perms::none);
    EXPECT_TRUE(sup->running());
}

TEST_F(ProcessSupervisorTest, StepsRunInOrder) {
    auto cfg = baseConfig();
    cfg.auto_update = true;
    ConfigStore store(dir.path() / "config.yaml", cfg);
    make(store)->start();

    ASSERT_EQ(runner.calls.size(), 3u);
    EXPECT_EQ(runner.calls[0].args.front(), "update");
    EXPECT_EQ(runner.calls[1].args.front(), "superuser");
    EXPECT_EQ(runner.calls[2].args.front(), "migrate");
    EXPECT_EQ(launcher.launched.size(), 1u);
}

TEST_F(ProcessSupervisorTest, UpdateFailureIsAWarning) {
    auto cfg = baseConfig();
    cfg.auto_update = true;
    bk::process::ProcessResult failed;
    failed.code = 1;
    runner.responses["update"] = failed;
    ConfigStore store(dir.path() / "config.yaml", cfg);

    const auto status = make(store)->start();
    EXPECT_TRUE(status.errors.empty());
    EXPECT_TRUE(contains(status.warnings, "Update check failed, using current version"));
    EXPECT_EQ(launcher.launched.size(), 1u);
}

TEST_F(ProcessSupervisorTest, DevAndAutomigrateFlagsReachServe) {
    auto cfg = baseConfig();
    cfg.advanced.dev = true;
    cfg.advanced.auto_migrate = false;
    ConfigStore store(dir.path() / "config.yaml", cfg);
    make(store)->start();

    ASSERT_EQ(launcher.launched.size(), 1u);
    const auto& args = launcher.launched[0].args;
    EXPECT_NE(std::find(args.begin(), args.end(), "--dev"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "--automigrate=false"), args.end());
}

TEST_F(ProcessSupervisorTest, ExposedStartupProbesPublicUrl) {
    auto cfg = baseConfig();
    cfg.server.expose_admin = true;
    ipDetector.ip = "198.51.100.4";
    health.healthy = false;
    ConfigStore store(dir.path() / "config.yaml", cfg);

    const auto status = make(store)->start();
    EXPECT_EQ(status.bindAddress, "0.0.0.0:8090");
    EXPECT_EQ(status.publicUrl, "http://198.51.100.4:8090");
    ASSERT_EQ(health.probed.size(), 1u);
    EXPECT_EQ(health.probed[0], "http://198.51.100.4:8090");
    EXPECT_EQ(status.healthCheckPassed, false);
    EXPECT_TRUE(contains(status.warnings, "Check firewall/port forwarding settings"));
}

TEST_F(ProcessSupervisorTest, SuperuserFailureIsFatal) {
    bk::process::ProcessResult failed;
    failed.code = 1;
    runner.responses["superuser"] = failed;
    ConfigStore store(dir.path() / "config.yaml", baseConfig());

    const auto status = make(store)->start();
    EXPECT_TRUE(contains(status.errors, "Failed to configure superuser (code 1)"));
    EXPECT_EQ(runner.countOf("migrate"), 0u);
    EXPECT_TRUE(launcher.launched.empty());
}

TEST_F(ProcessSupervisorTest, SpawnFailureIsFatal) {
    launcher.fail = true;
    ConfigStore store(dir.path() / "config.yaml", baseConfig());

    const auto status = make(store)->start();
    EXPECT_TRUE(contains(status.errors, "Failed to start backend: exec failed"));
    EXPECT_EQ(authCalls.load(), 0);
}

TEST_F(ProcessSupervisorTest, EarlyExitIsFatal) {
    launcher.exitImmediately = true;
    ConfigStore store(dir.path() / "config.yaml", baseConfig());
    auto sup = make(store);

    const auto status = sup->start();
    EXPECT_TRUE(contains(status.errors, "Backend exited during startup"));
    EXPECT_FALSE(status.clientAuthenticated.has_value());
    EXPECT_FALSE(sup->running());
}

TEST_F(ProcessSupervisorTest, FailedAuthenticationIsReported) {
    authSucceeds = false;
    ConfigStore store(dir.path() / "config.yaml", baseConfig());

    const auto status = make(store)->start();
    EXPECT_TRUE(status.errors.empty());
    EXPECT_EQ(status.clientAuthenticated, false);
    EXPECT_EQ(authCalls.load(), 3);
    EXPECT_TRUE(contains(status.warnings, "Client failed to authenticate - check superuser credentials"));
}

TEST_F(ProcessSupervisorTest, HandshakeTimeoutRecordsFalse) {
    ConfigStore store(dir.path() / "config.yaml", baseConfig());
    ProcessSupervisor::Options opts;
    opts.resourceDir = dir.path();
    opts.settleDelay = 0ms;
    opts.readinessTimeout = 50ms;
    opts.stopGrace = 10ms;

    ProcessSupervisor sup({
        .store = store, .runner = runner, .launcher = launcher, .ipDetector = ipDetector, .health = health,
        .liveBackups = liveBackups, .settings = settings,
        .authenticate = [](const ServerReady&, const std::string&, const std::string&) {
            std::this_thread::sleep_for(300ms);
        },
        .offlineBackups = &offlineBackups,
    }, opts);

    const auto status = sup.start();
    EXPECT_EQ(status.clientAuthenticated, false);
    sup.stop();
}

TEST_F(ProcessSupervisorTest, GeneratedCredentialsAreUsedForHandshake) {
    ConfigStore store(dir.path() / "config.yaml");
    std::string seenEmail;
    ProcessSupervisor::Options opts;
    opts.resourceDir = dir.path();
    opts.settleDelay = 0ms;

    ProcessSupervisor sup({
        .store = store, .runner = runner, .launcher = launcher, .ipDetector = ipDetector, .health = health,
        .liveBackups = liveBackups, .settings = settings,
        .authenticate = [&](const ServerReady&, const std::string& email, const std::string&) { seenEmail = email; },
        .offlineBackups = &offlineBackups,
    }, opts);

    const auto status = sup.start();
    ASSERT_TRUE(status.generated.has_value());
    EXPECT_EQ(seenEmail, status.generated->email);
    EXPECT_EQ(status.clientAuthenticated, true);
}

TEST_F(ProcessSupervisorTest, StartupBackupRotatesToKeepLast) {
    auto cfg = baseConfig();
    cfg.backup.enabled = true;
    cfg.backup.keep_last = 2;
    offlineBackups.seed("auto_startup_1.zip", std::chrono::system_clock::time_point{} + 1h);
    offlineBackups.seed("auto_startup_2.zip", std::chrono::system_clock::time_point{} + 2h);
    offlineBackups.seed("auto_startup_3.zip", std::chrono::system_clock::time_point{} + 3h);
    offlineBackups.seed("manual.zip", std::chrono::system_clock::time_point{});
    ConfigStore store(dir.path() / "config.yaml", cfg);

    const auto status = make(store)->start();
    EXPECT_TRUE(status.errors.empty());

    std::size_t prefixed = 0;
    for (const auto& r : offlineBackups.records) if (r.key.rfind("auto_", 0) == 0) ++prefixed;
    EXPECT_EQ(prefixed, 2u);
    EXPECT_TRUE(std::any_of(offlineBackups.records.begin(), offlineBackups.records.end(),
                            [](const auto& r) { return r.key == "manual.zip"; }));
    EXPECT_TRUE(std::any_of(offlineBackups.records.begin(), offlineBackups.records.end(),
                            [](const auto& r) { return r.key.rfind("auto_startup_", 0) == 0 && r.key.size() > 20; }));
    EXPECT_TRUE(liveBackups.records.empty());
}

TEST_F(ProcessSupervisorTest, StartupBackupFailureIsAWarning) {
    auto cfg = baseConfig();
    cfg.backup.enabled = true;
    offlineBackups.failCreate = true;
    ConfigStore store(dir.path() / "config.yaml", cfg);

    const auto status = make(store)->start();
    EXPECT_TRUE(status.errors.empty());
    EXPECT_TRUE(contains(status.warnings, "Backup creation failed: disk full"));
    EXPECT_EQ(launcher.launched.size(), 1u);
}

TEST_F(ProcessSupervisorTest, SettingsAreReconciledAndSyncedBack) {
    auto cfg = baseConfig();
    cfg.advanced.smtp.enabled = true;
    cfg.advanced.smtp.host = "smtp.example.com";
    ConfigStore store(dir.path() / "config.yaml", cfg);
    auto sup = make(store);

    sup->start();
    ASSERT_EQ(settings.updates.size(), 1u);

    bk::backend::SmtpSettings edited;
    edited.host = "relay.example.com";
    edited.port = 25;
    settings.current.smtp = edited;

    sup->stop();
    EXPECT_EQ(store.get().advanced.smtp.host, "relay.example.com");
    EXPECT_EQ(store.get().advanced.smtp.port, 25);
}

TEST_F(ProcessSupervisorTest, StopIsIdempotentAndTerminatesOnce) {
    ConfigStore store(dir.path() / "config.yaml", baseConfig());
    auto sup = make(store);
    sup->start();
    ASSERT_TRUE(sup->running());

    sup->stop();
    EXPECT_FALSE(sup->running());
    sup->stop();
    sup->stop();
    EXPECT_EQ(launcher.terminations.load(), 1);
}

TEST_F(ProcessSupervisorTest, DestructorStopsTheChild) {
    ConfigStore store(dir.path() / "config.yaml", baseConfig());
    {
        auto sup = make(store);
        sup->start();
    }
    EXPECT_EQ(launcher.terminations.load(), 1);
}

TEST_F(ProcessSupervisorTest, BackendOutputIsFilteredBeforeLogging) {
    ConfigStore store(dir.path() / "config.yaml", baseConfig());
    auto sup = make(store);
    sup->start();
    ASSERT_TRUE(static_cast<bool>(launcher.onLine));
    EXPECT_NO_THROW(launcher.onLine(bk::process::OutputStream::Stdout, "Server started at http://0.0.0.0:8090"));
    EXPECT_NO_THROW(launcher.onLine(bk::process::OutputStream::Stderr, "  something odd  "));
}

TEST_F(ProcessSupervisorTest, StopWithoutStartIsNoOp) {
    ConfigStore store(dir.path() / "config.yaml", baseConfig());
    auto sup = make(store);
    EXPECT_NO_THROW(sup->stop());
    EXPECT_EQ(settings.getCalls, 0);
}

TEST_F(ProcessSupervisorTest, ScheduledBackupsStopWithTheSupervisor) {
    auto cfg = baseConfig();
    cfg.backup.enabled = true;
    cfg.backup.on_startup = false;
    cfg.backup.schedule = 1;
    ConfigStore store(dir.path() / "config.yaml", cfg);
    auto sup = make(store);

    sup->start();
    std::this_thread::sleep_for(1500ms);
    sup->stop();
    const auto taken = liveBackups.list().size();
    EXPECT_GE(taken, 1u);

    std::this_thread::sleep_for(1200ms);
    EXPECT_EQ(liveBackups.list().size(), taken);
    EXPECT_TRUE(offlineBackups.records.empty());
}
