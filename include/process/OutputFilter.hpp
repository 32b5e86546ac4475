#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bk::process {

enum class OutputStream { Stdout, Stderr };

// Rewrites the wrapped binary's output before it reaches the log: wildcard-bind
// URLs become the advertised public URL, and the binary's own startup banner
// and first-run setup hints are dropped (credentials are provisioned out of band).
class OutputFilter {
public:
    explicit OutputFilter(std::string publicUrl) : publicUrl_(std::move(publicUrl)) {}

    // nullopt when the line should not be logged
    [[nodiscard]] std::optional<std::string> apply(OutputStream stream, std::string_view line) const;

    [[nodiscard]] std::string rewriteWildcardUrls(std::string_view line) const;

    static bool isSuppressed(std::string_view line);

private:
    std::string publicUrl_;
};

}
