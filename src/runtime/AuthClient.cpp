#include "runtime/AuthClient.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace bk::runtime;
using namespace bk::log;

AuthClient::AuthClient(ReadinessCoordinator& coordinator, CredentialsProvider credentials, Authenticate authenticate,
                       util::RetryPolicy policy)
    : coordinator_(coordinator), credentials_(std::move(credentials)), authenticate_(std::move(authenticate)),
      policy_(policy) {
    coordinator_.onServerReady([this](const ServerReady& ready, const ReadinessCoordinator::AttemptId attempt) {
        onServerReady(ready, attempt);
    });
}

AuthClient::~AuthClient() {
    coordinator_.onServerReady(nullptr);
    cancel();
}

void AuthClient::cancel() {
    {
        std::scoped_lock lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void AuthClient::onServerReady(const ServerReady& ready, const ReadinessCoordinator::AttemptId attempt) {
    if (worker_.joinable()) cancel();
    {
        std::scoped_lock lock(mutex_);
        cancelled_ = false;
    }

    auto creds = credentials_ ? credentials_() : config::SuperuserConfig{};
    if (!creds.hasCredentials()) {
        Registry::auth()->warn("[AuthClient] No superuser credentials available");
        coordinator_.acknowledge(attempt, ClientReady{false});
        return;
    }

    worker_ = std::thread(&AuthClient::run, this, ready, std::move(creds), attempt);
}

void AuthClient::run(ServerReady ready, config::SuperuserConfig creds, const ReadinessCoordinator::AttemptId attempt) {
    bool ok = false;
    try {
        unsigned int tries = 0;
        util::retryWithBackoff([&] {
            ++tries;
            authenticate_(ready, creds.email, creds.password);
        }, policy_, [this](const std::chrono::milliseconds d) { interruptibleSleep(d); });
        Registry::auth()->info("[AuthClient] Authenticated as {} after {} attempt(s)", creds.email, tries);
        ok = true;
    } catch (const std::exception& e) {
        Registry::auth()->error("[AuthClient] Authentication failed: {}", e.what());
    }

    coordinator_.acknowledge(attempt, ClientReady{ok});
}

void AuthClient::interruptibleSleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, d, [this] { return cancelled_; }))
        throw std::runtime_error("authentication cancelled");
}
