#include "network/PublicIpDetector.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <arpa/inet.h>

using namespace bk::network;
using namespace bk::util;
using namespace bk::log;

CurlPublicIpDetector::CurlPublicIpDetector(std::string echoUrl, const std::chrono::milliseconds timeout)
    : echoUrl_(std::move(echoUrl)), timeout_(timeout) {}

std::optional<std::string> CurlPublicIpDetector::detect() {
    const auto r = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, echoUrl_.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    }, timeout_);

    if (!r.ok()) {
        Registry::http()->debug("[PublicIpDetector] Failed to get public IP: {}",
                                r.curl != CURLE_OK ? r.error : "HTTP " + std::to_string(r.http));
        return std::nullopt;
    }

    const auto first = r.body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    const auto last = r.body.find_last_not_of(" \t\r\n");
    auto ip = r.body.substr(first, last - first + 1);

    if (!looksLikeIpAddress(ip)) {
        Registry::http()->debug("[PublicIpDetector] Echo service returned something other than an address");
        return std::nullopt;
    }
    return ip;
}

bool bk::network::looksLikeIpAddress(const std::string& s) {
    in_addr v4{};
    in6_addr v6{};
    return inet_pton(AF_INET, s.c_str(), &v4) == 1 || inet_pton(AF_INET6, s.c_str(), &v6) == 1;
}
