#include "backend/LocalBackupStore.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <stdexcept>

using namespace bk::backend;
using namespace bk::log;
namespace fs = std::filesystem;

LocalBackupStore::LocalBackupStore(process::CommandRunner& runner, fs::path dataDir,
                                   const std::chrono::milliseconds timeout)
    : runner_(runner), dataDir_(std::move(dataDir)), timeout_(timeout) {}

BackupRecord LocalBackupStore::create(const std::string& basename) {
    if (!fs::is_directory(dataDir_))
        throw std::runtime_error(fmt::format("Data directory does not exist: {}", dataDir_.string()));

    const auto name = normalizeBackupName(basename);
    const auto target = backupsDir() / name;

    std::error_code ec;
    fs::create_directories(backupsDir(), ec);
    if (ec) throw std::runtime_error(fmt::format("Cannot create {}: {}", backupsDir().string(), ec.message()));
    if (fs::exists(target)) throw std::runtime_error(fmt::format("Backup {} already exists", name));

    process::Command cmd;
    cmd.executable = "zip";
    cmd.args = {"-r", "-q", (fs::path("backups") / name).string(), ".", "-x", "backups/*"};
    cmd.workingDir = dataDir_;

    const auto res = runner_.run(cmd, timeout_);
    if (res.timedOut) {
        fs::remove(target, ec);
        throw std::runtime_error("zip timed out");
    }
    if (!res.ok()) {
        fs::remove(target, ec);
        throw std::runtime_error(fmt::format("zip exited with code {}: {}", res.code, res.err));
    }

    if (!fs::is_regular_file(target)) throw std::runtime_error(fmt::format("zip did not produce {}", name));

    Registry::backup()->debug("[LocalBackupStore] Wrote {}", target.string());
    return recordFor(fs::directory_entry(target));
}

std::vector<BackupRecord> LocalBackupStore::list() {
    std::vector<BackupRecord> out;
    if (!fs::is_directory(backupsDir())) return out;

    for (const auto& entry : fs::directory_iterator(backupsDir())) {
        if (!entry.is_regular_file() || entry.path().extension() != ".zip") continue;
        out.push_back(recordFor(entry));
    }
    return out;
}

void LocalBackupStore::remove(const std::string& key) {
    if (key.empty() || key.find('/') != std::string::npos || key == "." || key == "..")
        throw std::invalid_argument(fmt::format("Invalid backup key: {}", key));

    std::error_code ec;
    if (!fs::remove(backupsDir() / key, ec)) {
        if (ec) throw std::runtime_error(fmt::format("Failed to remove {}: {}", key, ec.message()));
        throw std::runtime_error(fmt::format("Backup {} not found", key));
    }
}

BackupRecord LocalBackupStore::recordFor(const fs::directory_entry& entry) {
    BackupRecord rec;
    rec.key = entry.path().filename().string();
    rec.size = entry.file_size();
    rec.createdAt = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(entry.last_write_time()));
    return rec;
}
