#pragma once

#include "backend/BackupApi.hpp"
#include "backend/SettingsApi.hpp"
#include "util/curlWrappers.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace bk::backend {

// Superuser session against the backend's REST API. Authentication happens on
// the readiness worker; backups and settings are used from the supervisor, so
// the token is guarded.
class AdminClient final : public BackupApi, public SettingsApi {
public:
    explicit AdminClient(std::string baseUrl, std::chrono::milliseconds timeout = std::chrono::seconds(10));

    // Throws std::runtime_error when the backend rejects or cannot be reached.
    void authenticate(const std::string& email, const std::string& password);

    BackupRecord create(const std::string& basename) override;
    std::vector<BackupRecord> list() override;
    void remove(const std::string& key) override;

    BackendSettings getAll() override;
    void update(const SettingsUpdate& partial) override;

private:
    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
    std::string token_;
    mutable std::mutex mutex_;

    util::HttpResponse send(const std::string& method, const std::string& path, const std::string* body = nullptr) const;
    static std::string describe(const util::HttpResponse& r);
    std::string token() const;
};

}
