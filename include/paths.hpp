#pragma once

#include <filesystem>

namespace bk::paths {

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/basekeeper/config.yaml";
inline constexpr const char* DEFAULT_LOG_PATH = "/var/log/basekeeper";

// BASEKEEPER_CONFIG overrides the default location
std::filesystem::path getConfigPath();

// Directory holding bin/, the data directory and the public directory.
// BASEKEEPER_HOME overrides; otherwise the directory of the config file.
std::filesystem::path getResourceDir();

std::filesystem::path getLogPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPathForTesting();

}
