#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ql::util {

inline std::time_t parsePostgresTimestamp(const std::string& timestampStr) {
    std::tm tm = {};
    std::istringstream ss(timestampStr.substr(0, 19)); // "YYYY-MM-DD HH:MM:SS", fractional seconds dropped
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);
    return timegm(&tm);
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// SigV4 x-amz-date, e.g. 20261018T094341Z
inline std::string getCurrentTimestamp() {
    const std::time_t now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

}
