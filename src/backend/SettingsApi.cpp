#include "backend/SettingsApi.hpp"

#include <nlohmann/json.hpp>

namespace bk::backend {

void to_json(nlohmann::json& j, const SmtpSettings& s) {
    j = {
        {"enabled", s.enabled},
        {"host", s.host},
        {"port", s.port},
        {"username", s.username},
        {"password", s.password},
        {"authMethod", s.authMethod},
        {"tls", s.tls},
        {"localName", s.localName}
    };
}

void from_json(const nlohmann::json& j, SmtpSettings& s) {
    s.enabled = j.value("enabled", false);
    s.host = j.value("host", "");
    s.port = j.value("port", 0);
    s.username = j.value("username", "");
    s.password = j.value("password", "");
    s.authMethod = j.value("authMethod", "");
    s.tls = j.value("tls", true);
    s.localName = j.value("localName", "");
}

void to_json(nlohmann::json& j, const S3Settings& s) {
    j = {
        {"enabled", s.enabled},
        {"bucket", s.bucket},
        {"region", s.region},
        {"endpoint", s.endpoint},
        {"accessKey", s.accessKey},
        {"secret", s.secret},
        {"forcePathStyle", s.forcePathStyle}
    };
}

void from_json(const nlohmann::json& j, S3Settings& s) {
    s.enabled = j.value("enabled", false);
    s.bucket = j.value("bucket", "");
    s.region = j.value("region", "");
    s.endpoint = j.value("endpoint", "");
    s.accessKey = j.value("accessKey", "");
    s.secret = j.value("secret", "");
    s.forcePathStyle = j.value("forcePathStyle", false);
}

void to_json(nlohmann::json& j, const SettingsUpdate& u) {
    j = nlohmann::json::object();
    if (u.smtp) j["smtp"] = *u.smtp;
    if (u.s3) j["s3"] = *u.s3;
}

void from_json(const nlohmann::json& j, BackendSettings& s) {
    if (j.contains("smtp") && j["smtp"].is_object()) s.smtp = j["smtp"].get<SmtpSettings>();
    if (j.contains("s3") && j["s3"].is_object()) s.s3 = j["s3"].get<S3Settings>();
}

}
