#include "backend/Commands.hpp"

#include <fmt/core.h>

namespace bk::backend::commands {

process::Command superuserUpsert(const std::filesystem::path& binary, const std::filesystem::path& cwd,
                                 const std::string& email, const std::string& password, const std::string& dataDir) {
    return {binary, {"superuser", "upsert", email, password, "--dir", dataDir}, cwd};
}

process::Command update(const std::filesystem::path& binary, const std::filesystem::path& cwd) {
    return {binary, {"update"}, cwd};
}

process::Command migrateUp(const std::filesystem::path& binary, const std::filesystem::path& cwd,
                           const std::string& dataDir) {
    return {binary, {"migrate", "up", "--dir", dataDir}, cwd};
}

process::Command serve(const std::filesystem::path& binary, const std::filesystem::path& cwd, const ServeOptions& opts) {
    process::Command cmd{binary, {
        "serve",
        fmt::format("--http={}", opts.bindAddress),
        fmt::format("--dir={}", opts.dataDir),
        fmt::format("--publicDir={}", opts.publicDir),
    }, cwd};

    if (opts.dev) cmd.args.emplace_back("--dev");
    if (!opts.autoMigrate) cmd.args.emplace_back("--automigrate=false");

    return cmd;
}

}
