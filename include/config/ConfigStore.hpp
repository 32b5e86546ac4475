#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <yaml-cpp/yaml.h>

namespace bk::config {

// Owns the persisted YAML document. Writes modify the parsed tree in place and
// re-emit it, so keys the schema doesn't know about survive a round trip.
class ConfigStore {
public:
    explicit ConfigStore(std::filesystem::path path);
    ConfigStore(std::filesystem::path path, Config cfg);

    // Reads the document. A missing file leaves defaults in place and returns false.
    bool load();

    [[nodiscard]] const Config& get() const { return config_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] bool fileLoaded() const { return fileLoaded_; }

    bool persistSuperuser(const SuperuserConfig& su);
    bool persistSmtp(const SmtpConfig& smtp);
    bool persistS3(const S3Config& s3);

private:
    std::filesystem::path path_;
    YAML::Node doc_;
    Config config_;
    bool fileLoaded_ = false;
    mutable std::mutex mutex_;

    bool writeDocument();
};

} // namespace bk::config
