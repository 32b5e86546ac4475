#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace bk::network {

class PublicIpDetector {
public:
    virtual ~PublicIpDetector() = default;

    // nullopt when the address could not be determined
    virtual std::optional<std::string> detect() = 0;
};

// Asks an IP-echo service for the address the host is seen under.
class CurlPublicIpDetector final : public PublicIpDetector {
public:
    static constexpr const char* DEFAULT_ECHO_URL = "https://api.ipify.org";

    explicit CurlPublicIpDetector(std::string echoUrl = DEFAULT_ECHO_URL,
                                  std::chrono::milliseconds timeout = std::chrono::seconds(5));

    std::optional<std::string> detect() override;

private:
    std::string echoUrl_;
    std::chrono::milliseconds timeout_;
};

bool looksLikeIpAddress(const std::string& s);

}
