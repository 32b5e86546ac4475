#pragma once

#include <string>
#include <vector>

namespace bk::runtime {

struct StartupStatus;

// The one consolidated report printed at the end of every start() attempt.
class StatusReporter {
public:
    // Adds the warnings implied by the handshake and health outcome.
    static void finalize(StartupStatus& status);

    // Box-drawn report, one entry per line.
    [[nodiscard]] static std::vector<std::string> render(const StartupStatus& status);

    static void report(StartupStatus& status);

    [[nodiscard]] static std::string title(const StartupStatus& status);
    [[nodiscard]] static std::string statusLine(const StartupStatus& status);
};

}
