// include/optsim/data/market_data_provider.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "optsim/core/error.hpp"
#include "optsim/core/types.hpp"

namespace optsim {

/**
 * @brief Source of historical option chains and underlying prices
 *
 * Implementations must tolerate concurrent get_option_chain calls when the
 * snapshot fetcher runs with parallel fetching enabled.
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /**
     * @brief Full option chain of a symbol as of a trading day
     * @return Quotes, or an error (DATA_NOT_FOUND, DATABASE_ERROR, ...)
     */
    virtual Result<std::vector<OptionQuote>> get_option_chain(const std::string& symbol,
                                                              const Timestamp& date) = 0;

    /**
     * @brief Daily closes of the underlying over [start, end], ascending
     */
    virtual Result<std::vector<std::pair<Timestamp, double>>> get_underlying_history(
        const std::string& symbol, const Timestamp& start, const Timestamp& end) = 0;
};

}  // namespace optsim
