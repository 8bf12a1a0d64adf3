#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace bk::util {

// SigV4 x-amz-date in UTC, e.g. 20130524T000000Z
inline std::string amzDate(const std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[17];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

inline std::string currentAmzDate() {
    return amzDate(std::chrono::system_clock::now());
}

}
