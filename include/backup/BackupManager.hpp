#pragma once

#include "backend/BackupApi.hpp"
#include "config/Config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bk::runtime { struct StartupStatus; }

namespace bk::backup {

// Backup policy on top of a BackupApi. Nothing here throws: failures are logged
// and come back as nullopt / empty / false.
class BackupManager {
public:
    BackupManager(config::BackupConfig cfg, backend::BackupApi& api);

    // A failure is also recorded as a warning on status, when one is given.
    std::optional<backend::BackupRecord> create(const std::string& basename, runtime::StartupStatus* status = nullptr);

    std::vector<backend::BackupRecord> list();

    bool remove(const std::string& key);

    // Deletes the oldest prefixed backups beyond keep_last. Returns how many were deleted.
    std::size_t rotate();

    // <prefix>startup_<timestamp>, then rotate. No-op unless enabled and on_startup.
    std::optional<backend::BackupRecord> startupBackup(runtime::StartupStatus* status = nullptr);

    // <prefix>scheduled_<timestamp>, then rotate.
    std::optional<backend::BackupRecord> scheduledBackup();

    [[nodiscard]] const config::BackupConfig& config() const { return cfg_; }

private:
    config::BackupConfig cfg_;
    backend::BackupApi& api_;
};

}
