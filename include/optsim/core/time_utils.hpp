// include/optsim/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include "optsim/core/error.hpp"
#include "optsim/core/types.hpp"

namespace optsim {
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
 * @brief Thread-safe wrapper for gmtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

constexpr int64_t SECONDS_PER_DAY = 86400;

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date
 */
inline int64_t days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/**
 * @brief Whole days since the epoch, flooring negative offsets
 */
inline int64_t days_since_epoch(const Timestamp& ts) {
    auto secs =
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    int64_t days = secs / SECONDS_PER_DAY;
    if (secs % SECONDS_PER_DAY < 0) {
        --days;
    }
    return days;
}

/**
 * @brief UTC midnight of the given calendar date
 */
inline Timestamp make_date(int year, unsigned month, unsigned day) {
    return Timestamp(std::chrono::seconds(days_from_civil(year, month, day) * SECONDS_PER_DAY));
}

/**
 * @brief Truncate a timestamp to its UTC midnight
 */
inline Timestamp floor_to_day(const Timestamp& ts) {
    return Timestamp(std::chrono::seconds(days_since_epoch(ts) * SECONDS_PER_DAY));
}

inline Timestamp add_days(const Timestamp& ts, int64_t days) {
    return ts + std::chrono::seconds(days * SECONDS_PER_DAY);
}

/**
 * @brief Calendar days from `from` to `to` (negative when `to` is earlier)
 */
inline int64_t days_between(const Timestamp& from, const Timestamp& to) {
    return days_since_epoch(to) - days_since_epoch(from);
}

/**
 * @brief Weekday index with Monday = 0 ... Sunday = 6
 */
inline int weekday_index(const Timestamp& ts) {
    // 1970-01-01 was a Thursday (index 3)
    int64_t idx = (days_since_epoch(ts) + 3) % 7;
    if (idx < 0) {
        idx += 7;
    }
    return static_cast<int>(idx);
}

/**
 * @brief Format as YYYY-MM-DD (UTC)
 */
inline std::string format_date(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    safe_gmtime(&time_t, &tm);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

/**
 * @brief Format as YYYY-MM-DD HH:MM:SS (UTC)
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    safe_gmtime(&time_t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buffer);
}

/**
 * @brief Parse a YYYY-MM-DD date (trailing time components are ignored)
 */
inline Result<Timestamp> parse_date(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    if (text.size() < 10 || std::sscanf(text.c_str(), "%4d-%2u-%2u", &year, &month, &day) != 3) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Invalid date '" + text + "', expected YYYY-MM-DD",
                                     "TimeUtils");
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Date out of range: " + text, "TimeUtils");
    }
    Timestamp ts = make_date(year, month, day);
    if (format_date(ts) != text.substr(0, 10)) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Date does not exist: " + text, "TimeUtils");
    }
    return ts;
}

}  // namespace core
}  // namespace optsim
