#pragma once

#include "runtime/AuthClient.hpp"
#include "runtime/ReadinessCoordinator.hpp"
#include "runtime/StartupStatus.hpp"
#include "util/retry.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>

namespace bk::config { class ConfigStore; }
namespace bk::backend { class BackupApi; class SettingsApi; }
namespace bk::backup { class BackupManager; class BackupScheduler; }
namespace bk::network { class PublicIpDetector; class HealthChecker; struct Endpoint; }
namespace bk::process { class CommandRunner; class ProcessLauncher; class ChildProcess; }

namespace bk::runtime {

// Owns the backend child and runs the startup sequence around it:
// validate, resolve binary, update, endpoint, superuser, migrations,
// startup backup, spawn, settle, handshake, health, settings, schedule, report.
class ProcessSupervisor {
public:
    struct Collaborators {
        config::ConfigStore& store;
        process::CommandRunner& runner;
        process::ProcessLauncher& launcher;
        network::PublicIpDetector& ipDetector;
        network::HealthChecker& health;
        backend::BackupApi& liveBackups;        // used while the backend is serving
        backend::SettingsApi& settings;
        AuthClient::Authenticate authenticate;
        backend::BackupApi* offlineBackups = nullptr;   // nullptr: zip the data directory directly
    };

    struct Options {
        std::filesystem::path resourceDir;
        std::chrono::milliseconds settleDelay{1000};
        std::chrono::milliseconds readinessTimeout{3000};
        std::chrono::milliseconds settingsDelay{2000};
        std::chrono::milliseconds stopGrace{5000};
        util::RetryPolicy authRetry{};
    };

    ProcessSupervisor(Collaborators collaborators, Options options);

    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Runs one startup attempt and returns what it found. Never throws for
    // step failures; those end up in the returned status.
    StartupStatus start();

    // Safe to call repeatedly.
    void stop();

    [[nodiscard]] bool running();

    [[nodiscard]] std::optional<int> exitCode() const;

    [[nodiscard]] std::optional<std::filesystem::path> resolveBinary(StartupStatus& status) const;

    [[nodiscard]] std::filesystem::path dataDir() const;

private:
    Collaborators c_;
    Options opts_;

    ReadinessCoordinator coordinator_;
    config::SuperuserConfig activeCredentials_;
    std::unique_ptr<AuthClient> authClient_;

    std::unique_ptr<process::ChildProcess> child_;
    std::shared_ptr<backup::BackupManager> liveBackupManager_;
    std::unique_ptr<backup::BackupScheduler> scheduler_;

    void selfUpdate(const std::filesystem::path& binary, StartupStatus& status);
    void startupBackup(StartupStatus& status);
    bool spawn(const std::filesystem::path& binary, const network::Endpoint& ep, StartupStatus& status);
    void handshake(const network::Endpoint& ep, StartupStatus& status);
    void scheduleBackups();
    StartupStatus finish(StartupStatus& status);
};

}
