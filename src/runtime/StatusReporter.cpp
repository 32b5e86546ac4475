#include "runtime/StatusReporter.hpp"
#include "runtime/StartupStatus.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace bk::runtime;
using namespace bk::log;

namespace {

// Display width in code points; every glyph used here is single-width.
std::size_t displayWidth(const std::string& s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(),
        [](const char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

std::string repeat(const std::string& glyph, const std::size_t n) {
    std::string out;
    out.reserve(glyph.size() * n);
    for (std::size_t i = 0; i < n; ++i) out += glyph;
    return out;
}

}

std::string StatusReporter::title(const StartupStatus& status) {
    if (!status.errors.empty()) return "Backend - Startup Failed";
    if (!status.warnings.empty()) return "Backend - Running with Warnings";
    return "Backend - System Ready";
}

std::string StatusReporter::statusLine(const StartupStatus& status) {
    if (status.clientAuthenticated == false) return "✗ Authentication Failed";
    if (status.clientAuthenticated != true) return {};
    if (!status.exposeAdmin || status.healthCheckPassed == true) return "✓ Started";
    if (status.healthCheckPassed == false) return "✗ Public URL Not Accessible";
    return {};
}

void StatusReporter::finalize(StartupStatus& status) {
    if (status.clientAuthenticated == false)
        status.addWarning("Client failed to authenticate - check superuser credentials");
    else if (status.clientAuthenticated == true && status.exposeAdmin && status.healthCheckPassed == false)
        status.addWarning("Check firewall/port forwarding settings");
}

std::vector<std::string> StatusReporter::render(const StartupStatus& status) {
    std::vector<std::string> content{title(status), ""};

    content.push_back("Mode:     " + std::string(status.exposeAdmin ? "Public" : "Internal"));
    content.push_back("Binding:  " + status.bindAddress);
    if (status.exposeAdmin) content.push_back("Admin:    " + status.publicUrl + "/_/");
    if (const auto line = statusLine(status); !line.empty()) content.push_back("Status:   " + line);

    if (status.generated) {
        content.emplace_back("");
        content.push_back("Email:    " + status.generated->email);
        content.push_back("Pass:     " + status.generated->password);
    }

    if (!status.warnings.empty()) {
        content.emplace_back("");
        content.emplace_back("Warnings:");
        for (const auto& w : status.warnings) content.push_back("   • " + w);
    }

    if (!status.errors.empty()) {
        content.emplace_back("");
        content.emplace_back("Errors:");
        for (const auto& e : status.errors) content.push_back("   • " + e);
    }

    std::size_t width = 0;
    for (const auto& l : content) width = std::max(width, displayWidth(l));

    std::vector<std::string> box;
    box.reserve(content.size() + 2);
    box.push_back("╔" + repeat("═", width + 4) + "╗");
    for (const auto& l : content)
        box.push_back("║  " + l + std::string(width - displayWidth(l), ' ') + "  ║");
    box.push_back("╚" + repeat("═", width + 4) + "╝");
    return box;
}

void StatusReporter::report(StartupStatus& status) {
    finalize(status);

    const auto log = Registry::basekeeper();
    const auto level = status.failed() ? spdlog::level::err
                     : status.warnings.empty() ? spdlog::level::info : spdlog::level::warn;

    for (const auto& line : render(status)) log->log(level, "{}", line);
}
