#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace bk::backend {

struct SmtpSettings {
    bool enabled = false;
    std::string host;
    int port = 0;
    std::string username;
    std::string password;
    std::string authMethod;
    bool tls = true;
    std::string localName;
};

struct S3Settings {
    bool enabled = false;
    std::string bucket;
    std::string region;
    std::string endpoint;
    std::string accessKey;
    std::string secret;
    bool forcePathStyle = false;
};

struct BackendSettings {
    std::optional<SmtpSettings> smtp;
    std::optional<S3Settings> s3;
};

// Only the sections that are set are sent.
struct SettingsUpdate {
    std::optional<SmtpSettings> smtp;
    std::optional<S3Settings> s3;

    [[nodiscard]] bool empty() const { return !smtp && !s3; }
};

class SettingsApi {
public:
    virtual ~SettingsApi() = default;

    virtual BackendSettings getAll() = 0;
    virtual void update(const SettingsUpdate& partial) = 0;
};

void to_json(nlohmann::json& j, const SmtpSettings& s);
void from_json(const nlohmann::json& j, SmtpSettings& s);
void to_json(nlohmann::json& j, const S3Settings& s);
void from_json(const nlohmann::json& j, S3Settings& s);
void to_json(nlohmann::json& j, const SettingsUpdate& u);
void from_json(const nlohmann::json& j, BackendSettings& s);

}
