#pragma once

#include <chrono>
#include <string>

namespace bk::network {

class HealthChecker {
public:
    virtual ~HealthChecker() = default;

    // True only when {baseUrl}/api/health answers 200. Never throws.
    virtual bool probe(const std::string& baseUrl) = 0;
};

class CurlHealthChecker final : public HealthChecker {
public:
    explicit CurlHealthChecker(std::chrono::milliseconds timeout = std::chrono::seconds(5)) : timeout_(timeout) {}

    bool probe(const std::string& baseUrl) override;

private:
    std::chrono::milliseconds timeout_;
};

}
