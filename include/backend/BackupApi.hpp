#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bk::backend {

struct BackupRecord {
    std::string key;
    std::chrono::system_clock::time_point createdAt;
    std::uintmax_t size = 0;
};

// Backup surface of the backend. Implementations throw std::runtime_error on failure;
// BackupManager turns those into soft results.
class BackupApi {
public:
    virtual ~BackupApi() = default;

    virtual BackupRecord create(const std::string& basename) = 0;
    virtual std::vector<BackupRecord> list() = 0;
    virtual void remove(const std::string& key) = 0;
};

// The backend only accepts lower-case [a-z0-9_-] names ending in ".zip".
std::string normalizeBackupName(const std::string& basename);

}
