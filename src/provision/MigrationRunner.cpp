#include "provision/MigrationRunner.hpp"
#include "backend/Commands.hpp"
#include "log/Registry.hpp"
#include "runtime/StartupStatus.hpp"

#include <fmt/core.h>

using namespace bk::provision;
using namespace bk::log;

MigrationRunner::MigrationRunner(config::MigrationsConfig migrations, std::string dataDir,
                                 process::CommandRunner& runner, std::filesystem::path resourceDir)
    : migrations_(std::move(migrations)), dataDir_(std::move(dataDir)), runner_(runner),
      resourceDir_(std::move(resourceDir)) {}

std::size_t MigrationRunner::countApplied(const std::string& output) {
    std::size_t n = 0;
    for (auto pos = output.find("Applied"); pos != std::string::npos; pos = output.find("Applied", pos + 1)) ++n;
    return n;
}

std::size_t MigrationRunner::apply(const std::filesystem::path& binary, runtime::StartupStatus& status) {
    if (!migrations_.auto_apply) return 0;

    try {
        const auto res = runner_.run(backend::commands::migrateUp(binary, resourceDir_, dataDir_),
                                     backend::commands::MIGRATE_TIMEOUT);

        if (res.ok()) {
            if (res.out.find("No migrations") != std::string::npos) return 0;
            const auto n = countApplied(res.out);
            if (n) Registry::backend()->info("[MigrationRunner] Applied {} migration{}", n, n != 1 ? "s" : "");
            return n;
        }

        if (res.err.find("no migration") != std::string::npos || res.out.find("No migrations") != std::string::npos)
            return 0;

        Registry::backend()->debug("[MigrationRunner] migrate up exited with {}: {}", res.code, res.err);
        status.addWarning(fmt::format("Failed to apply migrations - check {} directory", migrations_.dir));
    } catch (const std::exception& e) {
        status.addWarning(fmt::format("Migration error: {}", e.what()));
    }
    return 0;
}
