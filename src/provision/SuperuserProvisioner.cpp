#include "provision/SuperuserProvisioner.hpp"
#include "backend/Commands.hpp"
#include "config/ConfigStore.hpp"
#include "crypto/PasswordGenerator.hpp"
#include "log/Registry.hpp"
#include "runtime/StartupStatus.hpp"

#include <fmt/core.h>
#include <stdexcept>

using namespace bk::provision;
using namespace bk::log;

static constexpr const char* SUCCESS_MARKER = "Successfully saved superuser";

SuperuserProvisioner::SuperuserProvisioner(config::ConfigStore& store, process::CommandRunner& runner,
                                           std::filesystem::path resourceDir, PasswordSource passwords)
    : store_(store), runner_(runner), resourceDir_(std::move(resourceDir)), passwords_(std::move(passwords)) {
    if (!passwords_) passwords_ = [] { return crypto::generate_secure_password(); };
}

std::string SuperuserProvisioner::generatedEmail(const std::optional<std::string>& detectedIp) {
    return fmt::format("admin@{}.local", detectedIp && !detectedIp->empty() ? *detectedIp : "localhost");
}

bool SuperuserProvisioner::provision(const std::filesystem::path& binary, const std::optional<std::string>& detectedIp,
                                     runtime::StartupStatus& status) {
    const auto& cfg = store_.get();

    config::SuperuserConfig su = cfg.superuser;
    const bool fresh = !su.hasCredentials();
    if (fresh) {
        su.email = generatedEmail(detectedIp);
        try {
            su.password = passwords_();
        } catch (const std::exception& e) {
            Registry::auth()->error("[SuperuserProvisioner] Password generation failed: {}", e.what());
            status.addError(fmt::format("Failed to configure superuser: {}", e.what()));
            return false;
        }
        Registry::auth()->info("[SuperuserProvisioner] No superuser configured, generated {}", su.email);
    }

    process::ProcessResult res;
    try {
        res = runner_.run(backend::commands::superuserUpsert(binary, resourceDir_, su.email, su.password,
                                                             cfg.advanced.data_dir),
                          backend::commands::SUPERUSER_TIMEOUT);
    } catch (const std::exception& e) {
        Registry::auth()->error("[SuperuserProvisioner] upsert could not run: {}", e.what());
    }

    if (res.code != 0 && res.out.find(SUCCESS_MARKER) == std::string::npos) {
        if (!res.err.empty()) Registry::auth()->debug("[SuperuserProvisioner] upsert stderr: {}", res.err);
        status.addError(fmt::format("Failed to configure superuser (code {})", res.code));
        return false;
    }

    if (fresh) {
        if (!store_.persistSuperuser(su)) status.addWarning("Failed to save credentials to config");
        status.generated = runtime::GeneratedCredentials{su.email, su.password};
    }

    Registry::auth()->debug("[SuperuserProvisioner] Superuser {} is in place", su.email);
    return true;
}
