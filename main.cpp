// Runtime
#include "runtime/ProcessSupervisor.hpp"

// Backend
#include "backend/AdminClient.hpp"
#include "process/PosixProcess.hpp"
#include "network/HealthChecker.hpp"
#include "network/PublicIpDetector.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "paths.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <fmt/core.h>
#include <thread>

using namespace bk::config;
using namespace bk::log;
using namespace bk::runtime;

namespace {
std::atomic<int> receivedSignal = 0;

void signalHandler(const int signum) { receivedSignal = signum; }
}

int main(const int argc, char** argv) {
    try {
        if (argc > 1) bk::paths::setConfigPath(argv[1]);

        ConfigRegistry::init(bk::paths::getConfigPath());
        Registry::init(ConfigRegistry::get().logging);

        auto& store = ConfigRegistry::store();
        if (!store.fileLoaded())
            Registry::config()->info("[*] No config at {}, using defaults", store.path().string());

        const auto resourceDir = bk::paths::getResourceDir();
        Registry::basekeeper()->info("[*] Supervising backend from {}", resourceDir.string());

        bk::process::SubprocessRunner runner;
        bk::process::PosixProcessLauncher launcher;
        bk::network::CurlPublicIpDetector ipDetector;
        bk::network::CurlHealthChecker health;
        bk::backend::AdminClient admin(fmt::format("http://127.0.0.1:{}", store.get().server.port));

        ProcessSupervisor supervisor({
            .store = store,
            .runner = runner,
            .launcher = launcher,
            .ipDetector = ipDetector,
            .health = health,
            .liveBackups = admin,
            .settings = admin,
            .authenticate = [&admin](const ServerReady&, const std::string& email, const std::string& password) {
                admin.authenticate(email, password);
            },
        }, {.resourceDir = resourceDir});

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto status = supervisor.start();
        if (status.failed()) {
            Registry::basekeeper()->error("[-] Startup failed, not supervising");
            return EXIT_FAILURE;
        }

        while (!receivedSignal && supervisor.running()) std::this_thread::sleep_for(std::chrono::milliseconds(250));

        int rc = EXIT_SUCCESS;
        if (receivedSignal) {
            Registry::basekeeper()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());
        } else {
            const auto code = supervisor.exitCode();
            Registry::basekeeper()->error("[-] Backend exited unexpectedly (code {})", code ? *code : -1);
            rc = EXIT_FAILURE;
        }

        supervisor.stop();
        Registry::basekeeper()->info("[✓] Backend shut down cleanly.");
        return rc;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::basekeeper()->error("[-] Failed to start basekeeper: {}", e.what());
        else fmt::print(stderr, "basekeeper: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
