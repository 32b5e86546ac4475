#pragma once

#include "backend/SettingsApi.hpp"
#include "config/Config.hpp"

#include <optional>

namespace bk::config { class ConfigStore; }

namespace bk::runtime {

struct StartupStatus;

// Keeps the backend's SMTP/S3 settings and the persisted config in step:
// config wins at startup, the backend wins at shutdown. Inactive unless SMTP
// or S3 is enabled in config.
class SettingsSync {
public:
    SettingsSync(config::ConfigStore& store, backend::SettingsApi& api);

    // Pushes config values the backend doesn't have yet.
    void reconcile(StartupStatus& status);

    // Pulls values edited in the backend's dashboard back into the config file.
    void syncToConfig();

    // The partial update reconcile() would send, empty when nothing differs.
    static backend::SettingsUpdate diffForBackend(const config::AdvancedConfig& cfg, const backend::BackendSettings& current);

    static std::optional<config::SmtpConfig> smtpChangedInBackend(const config::SmtpConfig& cfg,
                                                                  const std::optional<backend::SmtpSettings>& current);
    static std::optional<config::S3Config> s3ChangedInBackend(const config::S3Config& cfg,
                                                              const std::optional<backend::S3Settings>& current);

private:
    config::ConfigStore& store_;
    backend::SettingsApi& api_;

    [[nodiscard]] bool active() const;
};

}
