// include/optsim/core/run_id_generator.hpp
// Utility for generating backtest run IDs
#pragma once

#include <string>
#include "optsim/core/types.hpp"

namespace optsim {

/**
 * @brief Generates run IDs of the form "LIQUIDITY_SCREEN_20251217_195130_366"
 */
class RunIdGenerator {
public:
    /**
     * @brief Generate a run ID for one strategy
     * @param strategy_name Strategy identifier, upper-cased in the result
     * @param timestamp Timestamp for the run
     */
    static std::string generate_run_id(const std::string& strategy_name,
                                       const Timestamp& timestamp);

    /**
     * @brief Timestamp string: "YYYYMMDD_HHMMSS_MMM" (UTC)
     */
    static std::string generate_timestamp_string(const Timestamp& timestamp);

private:
    static std::string normalize_name(const std::string& strategy_name);
};

}  // namespace optsim
