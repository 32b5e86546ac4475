#include "network/HealthChecker.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

using namespace bk::network;
using namespace bk::util;
using namespace bk::log;

bool CurlHealthChecker::probe(const std::string& baseUrl) {
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/api/health";

    const auto r = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    }, timeout_);

    if (r.curl != CURLE_OK) {
        Registry::http()->debug("[HealthChecker] {} unreachable: {}", url, r.error);
        return false;
    }

    Registry::http()->debug("[HealthChecker] {} -> {}", url, r.http);
    return r.http == 200;
}
