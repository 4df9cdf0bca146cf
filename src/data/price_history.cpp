// src/data/price_history.cpp

#include "optsim/data/price_history.hpp"
#include <algorithm>
#include <stdexcept>
#include "optsim/core/time_utils.hpp"

namespace optsim {

PriceHistory::PriceHistory(std::shared_ptr<MarketDataProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw std::invalid_argument("PriceHistory requires a market data provider");
    }
}

Result<PriceSeries> PriceHistory::closes(const std::string& symbol, int lookback_days) const {
    if (lookback_days < 0) {
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT,
                                       "Lookback must be non-negative, got " +
                                           std::to_string(lookback_days),
                                       "PriceHistory");
    }

    Timestamp start = core::add_days(as_of_, -lookback_days);
    auto load = [&]() -> Result<PriceSeries> {
        try {
            return provider_->get_underlying_history(symbol, start, as_of_);
        } catch (const std::exception& e) {
            return make_error<PriceSeries>(ErrorCode::MARKET_DATA_ERROR,
                                           "Provider threw while loading history of " + symbol +
                                               ": " + e.what(),
                                           "PriceHistory");
        }
    };

    Result<PriceSeries> series = load();
    if (series.is_error()) {
        return series;
    }

    PriceSeries points = series.take_value();
    points.erase(std::remove_if(points.begin(), points.end(),
                                [this, &start](const std::pair<Timestamp, double>& point) {
                                    return point.first < start || point.first > as_of_;
                                }),
                 points.end());
    std::sort(points.begin(), points.end());
    return Result<PriceSeries>(std::move(points));
}

Result<double> PriceHistory::average_close(const std::string& symbol, int lookback_days) const {
    auto series = closes(symbol, lookback_days);
    if (series.is_error()) {
        return make_error<double>(series.error()->code(), series.error()->what(),
                                  "PriceHistory");
    }

    const PriceSeries& points = series.value();
    if (points.empty()) {
        return make_error<double>(ErrorCode::DATA_NOT_FOUND,
                                  "No closes for " + symbol + " in the " +
                                      std::to_string(lookback_days) + " days to " +
                                      core::format_date(as_of_),
                                  "PriceHistory");
    }

    double sum = 0.0;
    for (const auto& point : points) {
        sum += point.second;
    }
    return Result<double>(sum / static_cast<double>(points.size()));
}

}  // namespace optsim
