#include <gtest/gtest.h>
#include "runtime/StatusReporter.hpp"
#include "runtime/StartupStatus.hpp"

#include <algorithm>

using namespace bk::runtime;

namespace {
bool anyLineContains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(),
                       [&](const std::string& l) { return l.find(needle) != std::string::npos; });
}

StartupStatus internalReady() {
    StartupStatus s;
    s.bindAddress = "127.0.0.1:8090";
    s.publicUrl = "http://localhost:8090";
    s.clientAuthenticated = true;
    return s;
}
}

TEST(StatusReporterTest, ReadyInternalReport) {
    auto s = internalReady();
    StatusReporter::finalize(s);
    const auto lines = StatusReporter::render(s);

    EXPECT_EQ(StatusReporter::title(s), "Backend - System Ready");
    EXPECT_TRUE(anyLineContains(lines, "Mode:     Internal"));
    EXPECT_TRUE(anyLineContains(lines, "Binding:  127.0.0.1:8090"));
    EXPECT_TRUE(anyLineContains(lines, "Status:   ✓ Started"));
    EXPECT_FALSE(anyLineContains(lines, "Admin:"));
    EXPECT_TRUE(s.warnings.empty());
}

TEST(StatusReporterTest, BoxLinesShareOneWidth) {
    auto s = internalReady();
    s.addWarning("a much longer warning line than anything else in this report");
    const auto lines = StatusReporter::render(s);

    ASSERT_GE(lines.size(), 3u);
    EXPECT_EQ(lines.front().rfind("╔", 0), 0u);
    EXPECT_EQ(lines.back().rfind("╚", 0), 0u);

    const auto width = [](const std::string& l) {
        return std::count_if(l.begin(), l.end(), [](const char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; });
    };
    for (const auto& l : lines) EXPECT_EQ(width(l), width(lines.front())) << l;
}

TEST(StatusReporterTest, AuthenticationFailureAddsWarning) {
    auto s = internalReady();
    s.clientAuthenticated = false;
    StatusReporter::finalize(s);

    EXPECT_EQ(StatusReporter::statusLine(s), "✗ Authentication Failed");
    EXPECT_EQ(StatusReporter::title(s), "Backend - Running with Warnings");
    ASSERT_EQ(s.warnings.size(), 1u);
    EXPECT_EQ(s.warnings[0], "Client failed to authenticate - check superuser credentials");
}

TEST(StatusReporterTest, ExposedWithFailedProbe) {
    auto s = internalReady();
    s.exposeAdmin = true;
    s.publicUrl = "https://db.example.com";
    s.healthCheckPassed = false;
    StatusReporter::finalize(s);
    const auto lines = StatusReporter::render(s);

    EXPECT_TRUE(anyLineContains(lines, "Mode:     Public"));
    EXPECT_TRUE(anyLineContains(lines, "Admin:    https://db.example.com/_/"));
    EXPECT_TRUE(anyLineContains(lines, "✗ Public URL Not Accessible"));
    EXPECT_TRUE(anyLineContains(lines, "Check firewall/port forwarding settings"));
}

TEST(StatusReporterTest, ShowsGeneratedCredentialsAndErrors) {
    StartupStatus s;
    s.generated = GeneratedCredentials{"admin@localhost.local", "p4ssw0rd"};
    s.addError("Failed to start backend: exec failed");
    const auto lines = StatusReporter::render(s);

    EXPECT_EQ(StatusReporter::title(s), "Backend - Startup Failed");
    EXPECT_TRUE(anyLineContains(lines, "Email:    admin@localhost.local"));
    EXPECT_TRUE(anyLineContains(lines, "Pass:     p4ssw0rd"));
    EXPECT_TRUE(anyLineContains(lines, "Errors:"));
    EXPECT_TRUE(anyLineContains(lines, "• Failed to start backend: exec failed"));
    EXPECT_FALSE(anyLineContains(lines, "Status:"));
}
