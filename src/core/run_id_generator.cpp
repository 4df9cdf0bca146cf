// src/core/run_id_generator.cpp

#include "optsim/core/run_id_generator.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "optsim/core/time_utils.hpp"

namespace optsim {

std::string RunIdGenerator::normalize_name(const std::string& strategy_name) {
    if (strategy_name.empty()) {
        return "BACKTEST";
    }
    std::string normalized;
    normalized.reserve(strategy_name.size());
    for (char c : strategy_name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        } else {
            normalized += '_';
        }
    }
    return normalized;
}

std::string RunIdGenerator::generate_timestamp_string(const Timestamp& timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  timestamp.time_since_epoch())
                  .count() %
              1000;

    std::tm tm;
    core::safe_gmtime(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    ss << "_" << std::setfill('0') << std::setw(3) << ms;
    return ss.str();
}

std::string RunIdGenerator::generate_run_id(const std::string& strategy_name,
                                            const Timestamp& timestamp) {
    return normalize_name(strategy_name) + "_" + generate_timestamp_string(timestamp);
}

}  // namespace optsim
