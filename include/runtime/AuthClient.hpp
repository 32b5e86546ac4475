#pragma once

#include "config/Config.hpp"
#include "runtime/ReadinessCoordinator.hpp"
#include "util/retry.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace bk::runtime {

// The dependent client. Once the server announces itself it logs in as the
// superuser on its own thread, retrying with backoff, and reports back
// through the coordinator.
class AuthClient {
public:
    // Throws on a rejected or failed login.
    using Authenticate = std::function<void(const ServerReady&, const std::string& email, const std::string& password)>;
    using CredentialsProvider = std::function<config::SuperuserConfig()>;

    AuthClient(ReadinessCoordinator& coordinator, CredentialsProvider credentials, Authenticate authenticate,
               util::RetryPolicy policy = {});

    ~AuthClient();

    AuthClient(const AuthClient&) = delete;
    AuthClient& operator=(const AuthClient&) = delete;

    // Abandons an in-flight login and joins the worker.
    void cancel();

private:
    ReadinessCoordinator& coordinator_;
    CredentialsProvider credentials_;
    Authenticate authenticate_;
    util::RetryPolicy policy_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;

    void onServerReady(const ServerReady& ready, ReadinessCoordinator::AttemptId attempt);
    void run(ServerReady ready, config::SuperuserConfig creds, ReadinessCoordinator::AttemptId attempt);
    void interruptibleSleep(std::chrono::milliseconds d);
};

}
