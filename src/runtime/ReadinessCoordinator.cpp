#include "runtime/ReadinessCoordinator.hpp"
#include "log/Registry.hpp"

using namespace bk::runtime;
using namespace bk::log;

void ReadinessCoordinator::onServerReady(Listener listener) {
    std::scoped_lock lock(mutex_);
    listener_ = std::move(listener);
}

ReadinessCoordinator::AttemptId ReadinessCoordinator::announce(const ServerReady& ready) {
    Listener listener;
    AttemptId attempt;
    {
        std::scoped_lock lock(mutex_);
        attempt = ++current_;
        open_ = true;
        slot_.reset();
        listener = listener_;
    }

    Registry::basekeeper()->debug("[ReadinessCoordinator] Server ready at {} (attempt {})", ready.url, attempt);
    if (listener) listener(ready, attempt);
    return attempt;
}

bool ReadinessCoordinator::acknowledge(const AttemptId attempt, const ClientReady ack) {
    {
        std::scoped_lock lock(mutex_);
        if (!open_ || attempt != current_ || slot_) {
            Registry::basekeeper()->debug("[ReadinessCoordinator] Discarding late acknowledgement for attempt {}", attempt);
            return false;
        }
        slot_ = ack;
    }
    cv_.notify_all();
    return true;
}

std::optional<ClientReady> ReadinessCoordinator::awaitAcknowledgement(const AttemptId attempt,
                                                                      const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (attempt != current_) return std::nullopt;

    cv_.wait_for(lock, timeout, [this] { return slot_.has_value(); });

    open_ = false;
    auto ack = slot_;
    slot_.reset();
    return ack;
}
