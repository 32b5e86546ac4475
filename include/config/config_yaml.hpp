#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace bk::config;

template<>
struct convert<ServerConfig> {
    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.expose_admin = node["expose_admin"].as<bool>(false);
        rhs.host = node["host"].as<std::string>("");
        rhs.port = node["port"].as<int>(DEFAULT_PORT);
        return true;
    }
};

template<>
struct convert<SuperuserConfig> {
    static bool decode(const Node& node, SuperuserConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.email = node["email"].as<std::string>("");
        rhs.password = node["password"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<MigrationsConfig> {
    static bool decode(const Node& node, MigrationsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.auto_apply = node["auto_apply"].as<bool>(true);
        rhs.dir = node["dir"].as<std::string>("pb_migrations");
        return true;
    }
};

template<>
struct convert<BackupConfig> {
    static bool decode(const Node& node, BackupConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(false);
        rhs.on_startup = node["on_startup"].as<bool>(true);
        rhs.schedule = node["schedule"].as<int>(0);
        rhs.keep_last = node["keep_last"].as<int>(7);
        rhs.prefix = node["prefix"].as<std::string>("auto_");
        return true;
    }
};

template<>
struct convert<SmtpConfig> {
    static bool decode(const Node& node, SmtpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(false);
        rhs.host = node["host"].as<std::string>("");
        rhs.port = node["port"].as<int>(DEFAULT_SMTP_PORT);
        rhs.username = node["username"].as<std::string>("");
        rhs.password = node["password"].as<std::string>("");
        rhs.local_name = node["local_name"].as<std::string>("");
        rhs.tls = node["tls"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<S3Config> {
    static bool decode(const Node& node, S3Config& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(false);
        rhs.bucket = node["bucket"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_key = node["secret_key"].as<std::string>("");
        rhs.force_path_style = node["force_path_style"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<AdvancedConfig> {
    static bool decode(const Node& node, AdvancedConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dev = node["dev"].as<bool>(false);
        rhs.auto_migrate = node["auto_migrate"].as<bool>(true);
        rhs.public_dir = node["public_dir"].as<std::string>("pb_public");
        rhs.data_dir = node["data_dir"].as<std::string>("pb_data");
        rhs.binary = node["binary"].as<std::string>("");
        if (node["smtp"]) rhs.smtp = node["smtp"].as<SmtpConfig>();
        if (node["s3"]) rhs.s3 = node["s3"].as<S3Config>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.console_level = spdlog::level::from_str(node["console_level"].as<std::string>("info"));
        rhs.file_level = spdlog::level::from_str(node["file_level"].as<std::string>("debug"));
        return true;
    }
};

} // namespace YAML

namespace bk::config {

// Decodes every known section of a parsed document; missing sections keep their defaults.
Config fromYaml(const YAML::Node& root);

}
