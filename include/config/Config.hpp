#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace bk::config {

constexpr static int DEFAULT_PORT = 8090;
constexpr static int DEFAULT_SMTP_PORT = 587;

struct ServerConfig {
    bool expose_admin = false;
    std::string host;       // public host/IP/URL, only used when expose_admin is set
    int port = DEFAULT_PORT;
};

struct SuperuserConfig {
    std::string email;
    std::string password;

    [[nodiscard]] bool hasCredentials() const { return !email.empty() && !password.empty(); }
};

struct MigrationsConfig {
    bool auto_apply = true;
    std::string dir = "pb_migrations";
};

struct BackupConfig {
    bool enabled = false;
    bool on_startup = true;
    int schedule = 0;       // seconds, 0 = disabled
    int keep_last = 7;      // 0 = keep everything
    std::string prefix = "auto_";
};

struct SmtpConfig {
    bool enabled = false;
    std::string host;
    int port = DEFAULT_SMTP_PORT;
    std::string username;
    std::string password;
    std::string local_name;
    bool tls = true;
};

struct S3Config {
    bool enabled = false;
    std::string bucket;
    std::string region;
    std::string endpoint;
    std::string access_key;
    std::string secret_key;
    bool force_path_style = false;
};

struct AdvancedConfig {
    bool dev = false;
    bool auto_migrate = true;
    std::string public_dir = "pb_public";
    std::string data_dir = "pb_data";
    std::string binary;     // empty = bundled bin/pocketbase-linux
    SmtpConfig smtp;
    S3Config s3;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty = paths::getLogPath()
    spdlog::level::level_enum console_level = spdlog::level::info;
    spdlog::level::level_enum file_level = spdlog::level::debug;
};

struct Config {
    ServerConfig server;
    bool auto_update = false;
    SuperuserConfig superuser;
    MigrationsConfig migrations;
    BackupConfig backup;
    AdvancedConfig advanced;
    LoggingConfig logging;
};

// Returns one message per violated invariant, empty when the config is usable.
std::vector<std::string> validate(const Config& cfg);

} // namespace bk::config
