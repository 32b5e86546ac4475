#pragma once

#include "process/Subprocess.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace bk::backend {

// Subcommands of the wrapped binary, with the bounds they run under.
namespace commands {

constexpr auto SUPERUSER_TIMEOUT = std::chrono::seconds(5);
constexpr auto UPDATE_TIMEOUT = std::chrono::seconds(30);
constexpr auto MIGRATE_TIMEOUT = std::chrono::seconds(30);

struct ServeOptions {
    std::string bindAddress;
    std::string dataDir;
    std::string publicDir;
    bool dev = false;
    bool autoMigrate = true;
};

process::Command superuserUpsert(const std::filesystem::path& binary, const std::filesystem::path& cwd,
                                 const std::string& email, const std::string& password, const std::string& dataDir);

process::Command update(const std::filesystem::path& binary, const std::filesystem::path& cwd);

process::Command migrateUp(const std::filesystem::path& binary, const std::filesystem::path& cwd,
                           const std::string& dataDir);

process::Command serve(const std::filesystem::path& binary, const std::filesystem::path& cwd, const ServeOptions& opts);

}

}
