#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace bk::backup {

class BackupManager;

// Periodic backups through the running backend. Lives only as long as the
// supervisor's current run; nothing about it is persisted.
class BackupScheduler final : public concurrency::AsyncService {
public:
    BackupScheduler(std::shared_ptr<BackupManager> manager, std::chrono::seconds interval);

    ~BackupScheduler() override;

protected:
    void runLoop() override;

private:
    std::shared_ptr<BackupManager> manager_;
    std::chrono::seconds interval_;
};

}
