#include "runtime/SettingsSync.hpp"
#include "runtime/StartupStatus.hpp"
#include "config/ConfigStore.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace bk::runtime;
using namespace bk::backend;
using namespace bk::config;
using namespace bk::log;

SettingsSync::SettingsSync(ConfigStore& store, SettingsApi& api) : store_(store), api_(api) {}

bool SettingsSync::active() const {
    const auto& adv = store_.get().advanced;
    return adv.smtp.enabled || adv.s3.enabled;
}

SettingsUpdate SettingsSync::diffForBackend(const AdvancedConfig& cfg, const BackendSettings& current) {
    SettingsUpdate u;

    if (cfg.smtp.enabled) {
        const auto& c = cfg.smtp;
        const auto& s = current.smtp;
        if (!s || s->host != c.host || s->port != c.port || s->username != c.username || s->password != c.password) {
            SmtpSettings out;
            out.enabled = true;
            out.host = c.host;
            out.port = c.port;
            out.username = c.username;
            out.password = c.password;
            out.authMethod = "PLAIN";
            out.tls = c.tls;
            out.localName = c.local_name.empty() ? "localhost" : c.local_name;
            u.smtp = std::move(out);
        }
    }

    if (cfg.s3.enabled) {
        const auto& c = cfg.s3;
        const auto& s = current.s3;
        if (!s || s->bucket != c.bucket || s->region != c.region || s->endpoint != c.endpoint) {
            S3Settings out;
            out.enabled = true;
            out.bucket = c.bucket;
            out.region = c.region;
            out.endpoint = c.endpoint;
            out.accessKey = c.access_key;
            out.secret = c.secret_key;
            out.forcePathStyle = c.force_path_style;
            u.s3 = std::move(out);
        }
    }

    return u;
}

std::optional<SmtpConfig> SettingsSync::smtpChangedInBackend(const SmtpConfig& cfg,
                                                             const std::optional<SmtpSettings>& current) {
    if (!cfg.enabled || !current) return std::nullopt;
    const auto& s = *current;
    if (s.host == cfg.host && s.port == cfg.port && s.username == cfg.username && s.password == cfg.password)
        return std::nullopt;

    SmtpConfig out;
    out.enabled = cfg.enabled;
    out.host = s.host;
    out.port = s.port ? s.port : DEFAULT_SMTP_PORT;
    out.username = s.username;
    out.password = s.password;
    out.local_name = s.localName;
    out.tls = s.tls;
    return out;
}

std::optional<S3Config> SettingsSync::s3ChangedInBackend(const S3Config& cfg, const std::optional<S3Settings>& current) {
    if (!cfg.enabled || !current) return std::nullopt;
    const auto& s = *current;
    if (s.bucket == cfg.bucket && s.region == cfg.region && s.endpoint == cfg.endpoint &&
        s.accessKey == cfg.access_key && s.secret == cfg.secret_key)
        return std::nullopt;

    S3Config out;
    out.enabled = cfg.enabled;
    out.bucket = s.bucket;
    out.region = s.region;
    out.endpoint = s.endpoint;
    out.access_key = s.accessKey;
    out.secret_key = s.secret;
    out.force_path_style = s.forcePathStyle;
    return out;
}

void SettingsSync::reconcile(StartupStatus& status) {
    if (!active()) return;

    try {
        const auto update = diffForBackend(store_.get().advanced, api_.getAll());
        if (update.empty()) return;
        api_.update(update);
        Registry::basekeeper()->debug("[SettingsSync] Backend settings updated from config");
    } catch (const std::exception& e) {
        status.addWarning(fmt::format("Failed to configure settings: {}", e.what()));
    }
}

void SettingsSync::syncToConfig() {
    if (!active()) return;

    try {
        const auto current = api_.getAll();
        const auto& adv = store_.get().advanced;

        bool changed = false;
        if (const auto smtp = smtpChangedInBackend(adv.smtp, current.smtp)) {
            if (!store_.persistSmtp(*smtp)) Registry::config()->warn("[SettingsSync] Failed to persist SMTP settings");
            else changed = true;
        }
        if (const auto s3 = s3ChangedInBackend(store_.get().advanced.s3, current.s3)) {
            if (!store_.persistS3(*s3)) Registry::config()->warn("[SettingsSync] Failed to persist S3 settings");
            else changed = true;
        }

        if (changed) Registry::config()->info("[SettingsSync] Config updated with latest backend settings");
    } catch (const std::exception& e) {
        Registry::config()->warn("[SettingsSync] Failed to sync settings to config: {}", e.what());
    }
}
