#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace bk::runtime {

struct ServerReady {
    std::string url;
    int port = 0;
    bool exposeAdmin = false;
};

struct ClientReady {
    bool authenticated = false;
};

// One announcement, one acknowledgement, per startup attempt. Acknowledgements
// that arrive after the supervisor stopped waiting are dropped.
class ReadinessCoordinator {
public:
    using AttemptId = std::uint64_t;
    using Listener = std::function<void(const ServerReady&, AttemptId)>;

    // Replaces any previously registered listener.
    void onServerReady(Listener listener);

    // Opens a new attempt and hands it to the listener on the calling thread.
    AttemptId announce(const ServerReady& ready);

    // Returns false when the attempt is no longer open.
    bool acknowledge(AttemptId attempt, ClientReady ack);

    // Waits for the acknowledgement of `attempt` and closes it either way.
    std::optional<ClientReady> awaitAcknowledgement(AttemptId attempt, std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    Listener listener_;
    AttemptId current_ = 0;
    bool open_ = false;
    std::optional<ClientReady> slot_;
};

}
