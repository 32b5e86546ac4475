#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>

namespace bk::process { class CommandRunner; }
namespace bk::runtime { struct StartupStatus; }

namespace bk::provision {

// `migrate up` before serving. Problems are warnings; migrations never hold up startup.
class MigrationRunner {
public:
    MigrationRunner(config::MigrationsConfig migrations, std::string dataDir, process::CommandRunner& runner,
                    std::filesystem::path resourceDir);

    // Number of migrations applied, 0 when nothing ran or on failure.
    std::size_t apply(const std::filesystem::path& binary, runtime::StartupStatus& status);

    static std::size_t countApplied(const std::string& output);

private:
    config::MigrationsConfig migrations_;
    std::string dataDir_;
    process::CommandRunner& runner_;
    std::filesystem::path resourceDir_;
};

}
