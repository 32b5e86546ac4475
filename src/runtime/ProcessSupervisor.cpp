#include "runtime/ProcessSupervisor.hpp"
#include "runtime/SettingsSync.hpp"
#include "runtime/StatusReporter.hpp"
#include "backend/Commands.hpp"
#include "backend/LocalBackupStore.hpp"
#include "backup/BackupManager.hpp"
#include "backup/BackupScheduler.hpp"
#include "config/ConfigStore.hpp"
#include "network/Endpoint.hpp"
#include "network/HealthChecker.hpp"
#include "process/ChildProcess.hpp"
#include "provision/MigrationRunner.hpp"
#include "provision/SuperuserProvisioner.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <thread>

using namespace bk::runtime;
using namespace bk::log;
namespace fs = std::filesystem;

static constexpr const char* DEFAULT_BINARY = "bin/pocketbase-linux";

ProcessSupervisor::ProcessSupervisor(Collaborators collaborators, Options options)
    : c_(std::move(collaborators)), opts_(std::move(options)) {
    authClient_ = std::make_unique<AuthClient>(
        coordinator_, [this] { return activeCredentials_; }, c_.authenticate, opts_.authRetry);
}

ProcessSupervisor::~ProcessSupervisor() {
    try {
        stop();
    } catch (const std::exception& e) {
        Registry::basekeeper()->error("[ProcessSupervisor] Error during shutdown: {}", e.what());
    }
}

fs::path ProcessSupervisor::dataDir() const {
    const fs::path dir = c_.store.get().advanced.data_dir;
    return dir.is_absolute() ? dir : opts_.resourceDir / dir;
}

std::optional<fs::path> ProcessSupervisor::resolveBinary(StartupStatus& status) const {
    const auto& configured = c_.store.get().advanced.binary;
    fs::path binary = configured.empty() ? fs::path(DEFAULT_BINARY) : fs::path(configured);
    if (binary.is_relative()) binary = opts_.resourceDir / binary;

    std::error_code ec;
    if (!fs::is_regular_file(binary, ec)) {
        status.addError(fmt::format("Backend executable not found: {}", binary.string()));
        return std::nullopt;
    }

    fs::permissions(binary,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) status.addWarning(fmt::format("Could not make {} executable: {}", binary.filename().string(), ec.message()));

    return binary;
}

void ProcessSupervisor::selfUpdate(const fs::path& binary, StartupStatus& status) {
    if (!c_.store.get().auto_update) return;

    Registry::basekeeper()->info("[ProcessSupervisor] Checking for backend updates...");
    const auto res = c_.runner.run(backend::commands::update(binary, opts_.resourceDir),
                                   backend::commands::UPDATE_TIMEOUT);
    if (!res.ok()) status.addWarning("Update check failed, using current version");
}

void ProcessSupervisor::startupBackup(StartupStatus& status) {
    const auto& cfg = c_.store.get().backup;
    if (!cfg.enabled || !cfg.on_startup) return;

    std::unique_ptr<backend::LocalBackupStore> local;
    backend::BackupApi* api = c_.offlineBackups;
    if (!api) {
        local = std::make_unique<backend::LocalBackupStore>(c_.runner, dataDir());
        api = local.get();
    }

    backup::BackupManager(cfg, *api).startupBackup(&status);
}

bool ProcessSupervisor::spawn(const fs::path& binary, const network::Endpoint& ep, StartupStatus& status) {
    const auto& adv = c_.store.get().advanced;

    const auto cmd = backend::commands::serve(binary, opts_.resourceDir, {
        .bindAddress = ep.bindAddress,
        .dataDir = adv.data_dir,
        .publicDir = adv.public_dir,
        .dev = adv.dev,
        .autoMigrate = adv.auto_migrate,
    });

    const process::OutputFilter filter(ep.publicUrl);
    auto onLine = [filter](const process::OutputStream stream, const std::string& raw) {
        const auto line = filter.apply(stream, raw);
        if (!line) return;
        if (stream == process::OutputStream::Stdout) Registry::backend()->debug("{}", *line);
        else Registry::backend()->warn("{}", *line);
    };

    try {
        Registry::basekeeper()->info("[ProcessSupervisor] Starting backend on {}", ep.bindAddress);
        child_ = c_.launcher.launch(cmd, std::move(onLine));
        return true;
    } catch (const std::exception& e) {
        status.addError(fmt::format("Failed to start backend: {}", e.what()));
        return false;
    }
}

void ProcessSupervisor::handshake(const network::Endpoint& ep, StartupStatus& status) {
    const auto& server = c_.store.get().server;

    const auto attempt = coordinator_.announce({ep.publicUrl, server.port, server.expose_admin});
    const auto ack = coordinator_.awaitAcknowledgement(attempt, opts_.readinessTimeout);

    if (!ack) {
        Registry::basekeeper()->warn("[ProcessSupervisor] Client did not acknowledge within {}ms",
                                     opts_.readinessTimeout.count());
        status.clientAuthenticated = false;
        return;
    }
    status.clientAuthenticated = ack->authenticated;
}

void ProcessSupervisor::scheduleBackups() {
    const auto& cfg = c_.store.get().backup;
    if (!cfg.enabled || cfg.schedule <= 0) return;

    liveBackupManager_ = std::make_shared<backup::BackupManager>(cfg, c_.liveBackups);
    scheduler_ = std::make_unique<backup::BackupScheduler>(liveBackupManager_, std::chrono::seconds(cfg.schedule));
    scheduler_->start();
}

StartupStatus ProcessSupervisor::finish(StartupStatus& status) {
    StatusReporter::report(status);
    return status;
}

StartupStatus ProcessSupervisor::start() {
    StartupStatus status;

    if (child_ && child_->isRunning()) {
        status.addError("Backend is already running");
        return finish(status);
    }
    stop();

    const auto& cfg = c_.store.get();
    status.exposeAdmin = cfg.server.expose_admin;

    for (auto& err : config::validate(cfg)) status.addError(std::move(err));
    if (status.failed()) return finish(status);

    const auto binary = resolveBinary(status);
    if (!binary) return finish(status);
    status.executable = *binary;

    selfUpdate(*binary, status);

    const auto ep = network::resolveEndpoint(cfg.server, c_.ipDetector, status);
    status.bindAddress = ep.bindAddress;
    status.publicUrl = ep.publicUrl;

    provision::SuperuserProvisioner provisioner(c_.store, c_.runner, opts_.resourceDir);
    if (!provisioner.provision(*binary, ep.detectedIp, status)) return finish(status);
    activeCredentials_ = status.generated
        ? config::SuperuserConfig{status.generated->email, status.generated->password}
        : c_.store.get().superuser;

    provision::MigrationRunner(cfg.migrations, cfg.advanced.data_dir, c_.runner, opts_.resourceDir)
        .apply(*binary, status);

    startupBackup(status);

    if (!spawn(*binary, ep, status)) return finish(status);

    std::this_thread::sleep_for(opts_.settleDelay);
    if (!child_->isRunning()) {
        status.addError("Backend exited during startup");
        child_.reset();
        return finish(status);
    }

    handshake(ep, status);

    if (status.exposeAdmin) status.healthCheckPassed = c_.health.probe(ep.publicUrl);

    if (cfg.advanced.smtp.enabled || cfg.advanced.s3.enabled) {
        std::this_thread::sleep_for(opts_.settingsDelay);
        SettingsSync(c_.store, c_.settings).reconcile(status);
    }

    scheduleBackups();

    return finish(status);
}

void ProcessSupervisor::stop() {
    if (scheduler_) {
        scheduler_->stop();
        scheduler_.reset();
        liveBackupManager_.reset();
    }

    if (!child_) return;

    authClient_->cancel();

    if (child_->isRunning()) {
        SettingsSync(c_.store, c_.settings).syncToConfig();
        Registry::basekeeper()->info("[ProcessSupervisor] Stopping backend...");
        child_->terminate(opts_.stopGrace);
    }

    child_.reset();
}

bool ProcessSupervisor::running() {
    return child_ && child_->isRunning();
}

std::optional<int> ProcessSupervisor::exitCode() const {
    return child_ ? child_->exitCode() : std::nullopt;
}
