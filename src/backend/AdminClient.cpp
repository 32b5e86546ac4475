#include "backend/AdminClient.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace bk::backend;
using namespace bk::log;
using namespace bk::util;
using json = nlohmann::json;

AdminClient::AdminClient(std::string baseUrl, const std::chrono::milliseconds timeout)
    : baseUrl_(std::move(baseUrl)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

void AdminClient::authenticate(const std::string& email, const std::string& password) {
    const std::string body = json{{"identity", email}, {"password", password}}.dump();
    const auto r = send("POST", "/api/collections/_superusers/auth-with-password", &body);
    if (!r.ok()) throw std::runtime_error(describe(r));

    const auto parsed = json::parse(r.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("token") || !parsed["token"].is_string())
        throw std::runtime_error("Authentication response did not contain a token");

    std::scoped_lock lock(mutex_);
    token_ = parsed["token"].get<std::string>();
}

BackupRecord AdminClient::create(const std::string& basename) {
    const auto name = normalizeBackupName(basename);
    const std::string body = json{{"name", name}}.dump();
    const auto r = send("POST", "/api/backups", &body);
    if (!r.ok()) throw std::runtime_error(describe(r));
    return {name, std::chrono::system_clock::now(), 0};
}

std::vector<BackupRecord> AdminClient::list() {
    const auto r = send("GET", "/api/backups");
    if (!r.ok()) throw std::runtime_error(describe(r));

    const auto parsed = json::parse(r.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array())
        throw std::runtime_error("Unexpected backup list response");

    std::vector<BackupRecord> out;
    out.reserve(parsed.size());
    for (const auto& item : parsed) {
        BackupRecord rec;
        rec.key = item.value("key", "");
        rec.size = item.value("size", std::uintmax_t{0});
        if (auto ts = parseUtcTimestamp(item.value("modified", ""))) rec.createdAt = *ts;
        if (!rec.key.empty()) out.push_back(std::move(rec));
    }
    return out;
}

void AdminClient::remove(const std::string& key) {
    const auto r = send("DELETE", "/api/backups/" + key);
    if (!r.ok()) throw std::runtime_error(describe(r));
}

BackendSettings AdminClient::getAll() {
    const auto r = send("GET", "/api/settings");
    if (!r.ok()) throw std::runtime_error(describe(r));

    const auto parsed = json::parse(r.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
        throw std::runtime_error("Unexpected settings response");
    return parsed.get<BackendSettings>();
}

void AdminClient::update(const SettingsUpdate& partial) {
    if (partial.empty()) return;
    const std::string body = json(partial).dump();
    const auto r = send("PATCH", "/api/settings", &body);
    if (!r.ok()) throw std::runtime_error(describe(r));
}

HttpResponse AdminClient::send(const std::string& method, const std::string& path, const std::string* body) const {
    const auto url = baseUrl_ + path;
    const auto bearer = token();

    SList headers;
    headers.add("Accept: application/json");
    if (body) headers.add("Content-Type: application/json");
    if (!bearer.empty()) headers.add("Authorization: " + bearer);

    auto r = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        if (body) {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        }
    }, timeout_);

    Registry::http()->trace("[AdminClient] {} {} -> {}", method, path, r.http);
    return r;
}

std::string AdminClient::describe(const HttpResponse& r) {
    if (r.curl != CURLE_OK) return r.error;

    const auto parsed = json::parse(r.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") && parsed["message"].is_string())
        return fmt::format("HTTP {}: {}", r.http, parsed["message"].get<std::string>());
    return fmt::format("HTTP {}", r.http);
}

std::string AdminClient::token() const {
    std::scoped_lock lock(mutex_);
    return token_;
}
