// include/optsim/data/price_history.hpp
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "optsim/core/error.hpp"
#include "optsim/core/types.hpp"
#include "optsim/data/market_data_provider.hpp"

namespace optsim {

using PriceSeries = std::vector<std::pair<Timestamp, double>>;

/**
 * @brief Read-only view of underlying closes for strategies
 *
 * The backtest loop moves as_of forward one trading day at a time. Queries
 * never return a close dated after as_of, so a strategy cannot see the future
 * even if the provider would hand it over.
 */
class PriceHistory {
public:
    explicit PriceHistory(std::shared_ptr<MarketDataProvider> provider);

    void set_as_of(const Timestamp& date) {
        as_of_ = date;
    }

    const Timestamp& as_of() const {
        return as_of_;
    }

    /**
     * @brief Closes of a symbol over the last lookback_days calendar days
     * @return Ascending series ending at or before as_of; INVALID_ARGUMENT for
     *         a negative lookback, MARKET_DATA_ERROR if the provider throws
     */
    Result<PriceSeries> closes(const std::string& symbol, int lookback_days) const;

    /**
     * @brief Mean of the closes returned by closes()
     * @return DATA_NOT_FOUND when the window holds no closes
     */
    Result<double> average_close(const std::string& symbol, int lookback_days) const;

private:
    std::shared_ptr<MarketDataProvider> provider_;
    Timestamp as_of_{};
};

}  // namespace optsim
