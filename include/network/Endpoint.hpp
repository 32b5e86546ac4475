#pragma once

#include "config/Config.hpp"

#include <optional>
#include <string>

namespace bk::runtime { struct StartupStatus; }

namespace bk::network {

class PublicIpDetector;

struct Endpoint {
    std::string bindAddress;
    std::string publicUrl;
    // Set when the public URL came from IP detection.
    std::optional<std::string> detectedIp;
};

// Turns a user supplied host into a URL:
//   http(s)://...     kept, a bare IPv4 without port gets :port
//   a.b.c.d:port      http://a.b.c.d:port
//   example.com       https://example.com
//   anything else     http://host:port
std::string buildSmartUrl(const std::string& host, int port);

// Bind address and advertised URL for the server section. Only consults the
// detector when exposure is on and no host is configured.
Endpoint resolveEndpoint(const config::ServerConfig& server, PublicIpDetector& detector, runtime::StartupStatus& status);

}
