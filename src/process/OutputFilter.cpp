#include "process/OutputFilter.hpp"

#include <array>
#include <cctype>

using namespace bk::process;

namespace {

constexpr std::string_view WILDCARD_URL = "http://0.0.0.0:";

constexpr std::array<std::string_view, 6> SUPPRESSED_FRAGMENTS = {
    "Server started at",
    "REST API:",
    "Dashboard:",
    "Launch the URL below",
    "create your first superuser account",
    "/_/#/pbinstal/",
};

constexpr std::array<std::string_view, 2> SUPPRESSED_PREFIXES = {"├─", "└─"};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

}

std::optional<std::string> OutputFilter::apply(const OutputStream stream, const std::string_view line) const {
    const auto trimmed = trim(line);
    if (trimmed.empty()) return std::nullopt;

    auto rewritten = rewriteWildcardUrls(trimmed);
    if (stream == OutputStream::Stdout && isSuppressed(rewritten)) return std::nullopt;
    return rewritten;
}

std::string OutputFilter::rewriteWildcardUrls(const std::string_view line) const {
    std::string out;
    out.reserve(line.size());

    size_t pos = 0;
    while (pos < line.size()) {
        const auto hit = line.find(WILDCARD_URL, pos);
        if (hit == std::string_view::npos) {
            out.append(line.substr(pos));
            break;
        }

        auto end = hit + WILDCARD_URL.size();
        const auto digitsStart = end;
        while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) ++end;

        out.append(line.substr(pos, hit - pos));
        if (end == digitsStart) out.append(WILDCARD_URL); // no port, leave as is
        else out.append(publicUrl_);
        pos = end;
    }

    return out;
}

bool OutputFilter::isSuppressed(const std::string_view line) {
    for (const auto& prefix : SUPPRESSED_PREFIXES)
        if (line.starts_with(prefix)) return true;
    for (const auto& fragment : SUPPRESSED_FRAGMENTS)
        if (line.find(fragment) != std::string_view::npos) return true;
    return false;
}
