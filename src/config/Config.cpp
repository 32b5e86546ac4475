#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace bk::config {

Config fromYaml(const YAML::Node& root) {
    Config cfg;
    if (!root || !root.IsMap()) return cfg;

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    cfg.auto_update = root["auto_update"].as<bool>(false);
    if (auto node = root["superuser"]) YAML::convert<SuperuserConfig>::decode(node, cfg.superuser);
    if (auto node = root["migrations"]) YAML::convert<MigrationsConfig>::decode(node, cfg.migrations);
    if (auto node = root["backup"]) YAML::convert<BackupConfig>::decode(node, cfg.backup);
    if (auto node = root["advanced"]) YAML::convert<AdvancedConfig>::decode(node, cfg.advanced);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::vector<std::string> validate(const Config& cfg) {
    std::vector<std::string> errors;

    if (cfg.server.port < 1 || cfg.server.port > 65535)
        errors.push_back(fmt::format("Invalid port: {} (must be 1-65535)", cfg.server.port));

    if (!cfg.superuser.email.empty() && cfg.superuser.email.find('@') == std::string::npos)
        errors.push_back(fmt::format("Invalid superuser email format: {}", cfg.superuser.email));

    const auto& smtp = cfg.advanced.smtp;
    if (smtp.enabled) {
        if (smtp.host.empty()) errors.emplace_back("SMTP enabled but Host is empty");
        if (smtp.port < 1) errors.emplace_back("SMTP enabled but Port is invalid");
    }

    const auto& s3 = cfg.advanced.s3;
    if (s3.enabled) {
        if (s3.bucket.empty()) errors.emplace_back("S3 enabled but Bucket is empty");
        if (s3.region.empty()) errors.emplace_back("S3 enabled but Region is empty");
    }

    if (cfg.backup.keep_last < 0) errors.emplace_back("backup.keep_last must be >= 0");
    if (cfg.backup.schedule < 0) errors.emplace_back("backup.schedule must be >= 0");

    return errors;
}

} // namespace bk::config
