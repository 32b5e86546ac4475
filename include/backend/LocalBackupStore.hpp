#pragma once

#include "backend/BackupApi.hpp"
#include "process/Subprocess.hpp"

#include <chrono>
#include <filesystem>

namespace bk::backend {

// Backups taken straight from the data directory while the server is down.
// Archives land in <dataDir>/backups, where the backend looks for them.
class LocalBackupStore final : public BackupApi {
public:
    static constexpr auto ZIP_TIMEOUT = std::chrono::seconds(120);

    LocalBackupStore(process::CommandRunner& runner, std::filesystem::path dataDir,
                     std::chrono::milliseconds timeout = ZIP_TIMEOUT);

    BackupRecord create(const std::string& basename) override;
    std::vector<BackupRecord> list() override;
    void remove(const std::string& key) override;

    [[nodiscard]] std::filesystem::path backupsDir() const { return dataDir_ / "backups"; }

private:
    process::CommandRunner& runner_;
    std::filesystem::path dataDir_;
    std::chrono::milliseconds timeout_;

    static BackupRecord recordFor(const std::filesystem::directory_entry& entry);
};

}
