#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace bk::util {

// ISO 8601 UTC without sub-seconds, ':' and '.' swapped for '-': 2026-10-17T12-30-05
inline std::string backupTimestamp(const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H-%M-%S");
    return oss.str();
}

// Accepts "YYYY-MM-DD HH:MM:SS[.fff][Z]" and "YYYY-MM-DDTHH:MM:SS[.fff][Z]", always UTC.
inline std::optional<std::chrono::system_clock::time_point> parseUtcTimestamp(const std::string& s) {
    if (s.size() < 19) return std::nullopt;

    std::string head = s.substr(0, 19);
    if (head[10] == 'T') head[10] = ' ';

    std::tm tm{};
    std::istringstream ss(head);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    if (s.size() > 20 && s[19] == '.') {
        int millis = 0, digits = 0;
        for (size_t i = 20; i < s.size() && digits < 3 && std::isdigit(static_cast<unsigned char>(s[i])); ++i, ++digits)
            millis = millis * 10 + (s[i] - '0');
        for (; digits < 3; ++digits) millis *= 10;
        tp += std::chrono::milliseconds(millis);
    }

    return tp;
}

} // namespace bk::util
