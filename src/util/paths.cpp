#include "paths.hpp"

#include <cstdlib>
#include <mutex>

namespace bk::paths {

namespace {
std::mutex pathMutex;
std::filesystem::path configOverride;
std::filesystem::path logOverride;

std::filesystem::path fromEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return {};
    return {value};
}
}

std::filesystem::path getConfigPath() {
    std::scoped_lock lock(pathMutex);
    if (!configOverride.empty()) return configOverride;
    if (auto env = fromEnv("BASEKEEPER_CONFIG"); !env.empty()) return env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getResourceDir() {
    if (auto env = fromEnv("BASEKEEPER_HOME"); !env.empty()) return env;
    const auto parent = std::filesystem::absolute(getConfigPath()).parent_path();
    return parent.empty() ? std::filesystem::current_path() : parent;
}

std::filesystem::path getLogPath() {
    std::scoped_lock lock(pathMutex);
    if (!logOverride.empty()) return logOverride;
    if (auto env = fromEnv("BASEKEEPER_LOG_DIR"); !env.empty()) return env;
    return DEFAULT_LOG_PATH;
}

void setConfigPath(const std::filesystem::path& path) {
    std::scoped_lock lock(pathMutex);
    configOverride = path;
}

void setLogPathForTesting() {
    std::scoped_lock lock(pathMutex);
    logOverride = std::filesystem::temp_directory_path() / "basekeeper_test_logs";
}

}
