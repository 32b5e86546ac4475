#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace bk::config { class ConfigStore; }
namespace bk::process { class CommandRunner; }
namespace bk::runtime { struct StartupStatus; }

namespace bk::provision {

// Makes sure the backend has an admin account matching the persisted
// credentials, generating and saving a fresh pair the first time round.
class SuperuserProvisioner {
public:
    using PasswordSource = std::function<std::string()>;

    SuperuserProvisioner(config::ConfigStore& store, process::CommandRunner& runner, std::filesystem::path resourceDir,
                         PasswordSource passwords = {});

    // False (with an error on status) when no password could be generated or the backend refused the upsert.
    bool provision(const std::filesystem::path& binary, const std::optional<std::string>& detectedIp,
                   runtime::StartupStatus& status);

    static std::string generatedEmail(const std::optional<std::string>& detectedIp);

private:
    config::ConfigStore& store_;
    process::CommandRunner& runner_;
    std::filesystem::path resourceDir_;
    PasswordSource passwords_;
};

}
