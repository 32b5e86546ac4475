#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace bk::concurrency;
using namespace bk::log;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // Derived classes stop in their own destructors; this only joins a worker
    // that was already asked to stop.
    interruptFlag_.store(true);
    waitCv_.notify_all();
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else if (worker_.joinable()) worker_.detach();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::basekeeper()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::basekeeper()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    Registry::basekeeper()->debug("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(waitMutex_);
        interruptFlag_.store(true);
    }
    waitCv_.notify_all();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false);

    Registry::basekeeper()->debug("[{}] Service stopped.", serviceName_);
}

bool AsyncService::waitFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(waitMutex_);
    return !waitCv_.wait_for(lock, d, [this] { return interruptFlag_.load(); });
}
