#include "network/Endpoint.hpp"
#include "network/PublicIpDetector.hpp"
#include "runtime/StartupStatus.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <regex>

using namespace bk::log;

namespace bk::network {

namespace {

const std::regex IPV4_PREFIX(R"(^\d+\.\d+\.\d+\.\d+)");
const std::regex IPV4_WITH_PORT(R"(^\d+\.\d+\.\d+\.\d+:\d+$)");
const std::regex DOMAIN_PREFIX(R"(^[a-zA-Z0-9.-]+\.[a-zA-Z]{2,})");

bool startsWith(const std::string& s, const std::string& prefix) { return s.rfind(prefix, 0) == 0; }

}

std::string buildSmartUrl(const std::string& host, const int port) {
    if (host.empty()) return {};

    if (startsWith(host, "http://") || startsWith(host, "https://")) {
        const auto hostPart = host.substr(host.find("://") + 3);
        if (hostPart.find(':') != std::string::npos) return host;
        if (std::regex_search(hostPart, IPV4_PREFIX)) return fmt::format("{}:{}", host, port);
        return host;
    }

    if (std::regex_match(host, IPV4_WITH_PORT)) return "http://" + host;

    if (std::regex_search(host, DOMAIN_PREFIX) && !std::regex_search(host, IPV4_PREFIX))
        return "https://" + host;

    return fmt::format("http://{}:{}", host, port);
}

Endpoint resolveEndpoint(const config::ServerConfig& server, PublicIpDetector& detector, runtime::StartupStatus& status) {
    Endpoint ep;

    if (!server.expose_admin) {
        ep.bindAddress = fmt::format("127.0.0.1:{}", server.port);
        ep.publicUrl = fmt::format("http://localhost:{}", server.port);
        return ep;
    }

    ep.bindAddress = fmt::format("0.0.0.0:{}", server.port);

    if (!server.host.empty()) {
        ep.publicUrl = buildSmartUrl(server.host, server.port);
        return ep;
    }

    Registry::basekeeper()->debug("[Endpoint] No host configured, detecting public IP...");
    if (auto ip = detector.detect()) {
        ep.publicUrl = fmt::format("http://{}:{}", *ip, server.port);
        ep.detectedIp = std::move(ip);
    } else {
        ep.publicUrl = fmt::format("http://0.0.0.0:{}", server.port);
        status.addWarning("Could not detect public IP - configure server.host manually");
    }
    return ep;
}

}
