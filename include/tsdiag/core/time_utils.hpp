#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>

namespace tsdiag {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Current local time formatted with strftime
 * @param format Format string compatible with strftime
 * @return Formatted time string, empty if the conversion failed
 */
inline std::string format_local_now(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result;
    if (safe_localtime(&now_c, &result) == nullptr) {
        return "";
    }

    char buffer[64];
    std::size_t written = std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer, written);
}

}  // namespace core
}  // namespace tsdiag
