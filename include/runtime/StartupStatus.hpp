#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bk::runtime {

struct GeneratedCredentials {
    std::string email;
    std::string password;
};

// Everything one start() attempt learned, handed to the StatusReporter at the end.
struct StartupStatus {
    std::filesystem::path executable;
    std::string bindAddress;
    std::string publicUrl;
    bool exposeAdmin = false;

    std::optional<bool> healthCheckPassed;
    std::optional<bool> clientAuthenticated;

    // Only set when credentials were created during this attempt.
    std::optional<GeneratedCredentials> generated;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(std::string msg) { errors.push_back(std::move(msg)); }
    void addWarning(std::string msg) { warnings.push_back(std::move(msg)); }

    [[nodiscard]] bool failed() const { return !errors.empty(); }
};

}
