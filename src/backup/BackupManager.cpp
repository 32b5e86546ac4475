#include "backup/BackupManager.hpp"
#include "log/Registry.hpp"
#include "runtime/StartupStatus.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace bk::backup;
using namespace bk::backend;
using namespace bk::log;

BackupManager::BackupManager(config::BackupConfig cfg, BackupApi& api)
    : cfg_(std::move(cfg)), api_(api) {}

std::optional<BackupRecord> BackupManager::create(const std::string& basename, runtime::StartupStatus* status) {
    try {
        auto rec = api_.create(basename);
        Registry::backup()->info("[BackupManager] Created backup {}", rec.key);
        return rec;
    } catch (const std::exception& e) {
        const auto msg = fmt::format("Backup creation failed: {}", e.what());
        Registry::backup()->warn("[BackupManager] {}", msg);
        if (status) status->addWarning(msg);
        return std::nullopt;
    }
}

std::vector<BackupRecord> BackupManager::list() {
    try {
        return api_.list();
    } catch (const std::exception& e) {
        Registry::backup()->warn("[BackupManager] Failed to list backups: {}", e.what());
        return {};
    }
}

bool BackupManager::remove(const std::string& key) {
    try {
        api_.remove(key);
        Registry::backup()->debug("[BackupManager] Deleted backup {}", key);
        return true;
    } catch (const std::exception& e) {
        Registry::backup()->warn("[BackupManager] Failed to delete backup {}: {}", key, e.what());
        return false;
    }
}

std::size_t BackupManager::rotate() {
    if (!cfg_.enabled || cfg_.keep_last <= 0) return 0;

    auto all = list();
    const auto keep = static_cast<std::size_t>(cfg_.keep_last);
    if (all.size() <= keep) return 0;

    // keys are stored normalised, so match against the normalised prefix
    auto prefix = normalizeBackupName(cfg_.prefix);
    prefix.resize(prefix.size() - 4);

    std::vector<BackupRecord> ours;
    std::copy_if(all.begin(), all.end(), std::back_inserter(ours),
                 [&](const BackupRecord& r) { return r.key.rfind(prefix, 0) == 0; });
    if (ours.size() <= keep) return 0;

    std::sort(ours.begin(), ours.end(),
              [](const BackupRecord& a, const BackupRecord& b) { return a.createdAt > b.createdAt; });

    std::size_t deleted = 0;
    for (auto it = ours.begin() + static_cast<std::ptrdiff_t>(keep); it != ours.end(); ++it)
        if (remove(it->key)) ++deleted;

    if (deleted) Registry::backup()->info("[BackupManager] Rotated out {} old backup(s)", deleted);
    return deleted;
}

std::optional<BackupRecord> BackupManager::startupBackup(runtime::StartupStatus* status) {
    if (!cfg_.enabled || !cfg_.on_startup) return std::nullopt;

    auto rec = create(cfg_.prefix + "startup_" + util::backupTimestamp(), status);
    if (rec) rotate();
    return rec;
}

std::optional<BackupRecord> BackupManager::scheduledBackup() {
    auto rec = create(cfg_.prefix + "scheduled_" + util::backupTimestamp());
    if (rec) rotate();
    return rec;
}
