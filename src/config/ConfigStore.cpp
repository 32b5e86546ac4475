#include "config/ConfigStore.hpp"
#include "config/config_yaml.hpp"
#include "log/Registry.hpp"

#include <fstream>

using namespace bk::config;
using namespace bk::log;

ConfigStore::ConfigStore(std::filesystem::path path)
    : path_(std::move(path)), doc_(YAML::NodeType::Map) {}

ConfigStore::ConfigStore(std::filesystem::path path, Config cfg)
    : path_(std::move(path)), doc_(YAML::NodeType::Map), config_(std::move(cfg)) {}

bool ConfigStore::load() {
    std::scoped_lock lock(mutex_);
    namespace fs = std::filesystem;

    if (!fs::exists(path_)) {
        fileLoaded_ = false;
        return false;
    }

    doc_ = YAML::LoadFile(path_.string());
    if (!doc_.IsMap()) doc_ = YAML::Node(YAML::NodeType::Map);
    config_ = fromYaml(doc_);
    fileLoaded_ = true;
    return true;
}

bool ConfigStore::persistSuperuser(const SuperuserConfig& su) {
    std::scoped_lock lock(mutex_);
    try {
        auto node = doc_["superuser"];
        node["email"] = su.email;
        node["password"] = su.password;
    } catch (const YAML::Exception& e) {
        Registry::config()->error("[ConfigStore] Malformed superuser section: {}", e.what());
        return false;
    }
    if (!writeDocument()) return false;
    config_.superuser = su;
    return true;
}

bool ConfigStore::persistSmtp(const SmtpConfig& smtp) {
    std::scoped_lock lock(mutex_);
    try {
        auto node = doc_["advanced"]["smtp"];
        node["host"] = smtp.host;
        node["port"] = smtp.port;
        node["username"] = smtp.username;
        node["password"] = smtp.password;
        node["local_name"] = smtp.local_name;
        node["tls"] = smtp.tls;
    } catch (const YAML::Exception& e) {
        Registry::config()->error("[ConfigStore] Malformed advanced.smtp section: {}", e.what());
        return false;
    }
    if (!writeDocument()) return false;

    const bool enabled = config_.advanced.smtp.enabled;
    config_.advanced.smtp = smtp;
    config_.advanced.smtp.enabled = enabled;
    return true;
}

bool ConfigStore::persistS3(const S3Config& s3) {
    std::scoped_lock lock(mutex_);
    try {
        auto node = doc_["advanced"]["s3"];
        node["bucket"] = s3.bucket;
        node["region"] = s3.region;
        node["endpoint"] = s3.endpoint;
        node["access_key"] = s3.access_key;
        node["secret_key"] = s3.secret_key;
        node["force_path_style"] = s3.force_path_style;
    } catch (const YAML::Exception& e) {
        Registry::config()->error("[ConfigStore] Malformed advanced.s3 section: {}", e.what());
        return false;
    }
    if (!writeDocument()) return false;

    const bool enabled = config_.advanced.s3.enabled;
    config_.advanced.s3 = s3;
    config_.advanced.s3.enabled = enabled;
    return true;
}

bool ConfigStore::writeDocument() {
    namespace fs = std::filesystem;

    YAML::Emitter out;
    out << doc_;
    if (!out.good()) {
        Registry::config()->error("[ConfigStore] Failed to emit config: {}", out.GetLastError());
        return false;
    }

    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    const auto tmp = fs::path(path_.string() + ".tmp");
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            Registry::config()->error("[ConfigStore] Failed to open {} for writing", tmp.string());
            return false;
        }
        file << out.c_str() << '\n';
        if (!file.good()) {
            Registry::config()->error("[ConfigStore] Failed to write {}", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        Registry::config()->error("[ConfigStore] Failed to replace {}: {}", path_.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }

    fileLoaded_ = true;
    return true;
}
