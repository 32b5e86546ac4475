#include "backup/BackupScheduler.hpp"
#include "backup/BackupManager.hpp"
#include "log/Registry.hpp"

using namespace bk::backup;
using namespace bk::log;

BackupScheduler::BackupScheduler(std::shared_ptr<BackupManager> manager, const std::chrono::seconds interval)
    : AsyncService("BackupScheduler"), manager_(std::move(manager)), interval_(interval) {}

BackupScheduler::~BackupScheduler() { stop(); }

void BackupScheduler::runLoop() {
    Registry::backup()->info("[BackupScheduler] Backing up every {}s", interval_.count());

    while (isRunning() && !interruptFlag_.load()) {
        if (!waitFor(interval_)) break;
        Registry::backup()->debug("[BackupScheduler] Running scheduled backup...");
        manager_->scheduledBackup();
    }
}
