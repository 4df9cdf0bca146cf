// src/strategy/liquidity_screen_strategy.cpp

#include "optsim/strategy/liquidity_screen_strategy.hpp"
#include <algorithm>
#include "optsim/core/logger.hpp"
#include "optsim/core/time_utils.hpp"

namespace optsim {

nlohmann::json LiquidityScreenConfig::to_json() const {
    nlohmann::json j;
    j["min_volume"] = min_volume;
    j["min_open_interest"] = min_open_interest;
    j["min_implied_volatility"] = min_implied_volatility;
    j["min_notional_value"] = min_notional_value;
    j["min_days_to_expiration"] = min_days_to_expiration;
    j["max_signals_per_day"] = max_signals_per_day;
    j["profit_target_pct"] = profit_target_pct;
    j["stop_loss_pct"] = stop_loss_pct;
    j["trend_lookback_days"] = trend_lookback_days;
    return j;
}

void LiquidityScreenConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_volume"))
        min_volume = j.at("min_volume").get<int64_t>();
    if (j.contains("min_open_interest"))
        min_open_interest = j.at("min_open_interest").get<int64_t>();
    if (j.contains("min_implied_volatility"))
        min_implied_volatility = j.at("min_implied_volatility").get<double>();
    if (j.contains("min_notional_value"))
        min_notional_value = j.at("min_notional_value").get<double>();
    if (j.contains("min_days_to_expiration"))
        min_days_to_expiration = j.at("min_days_to_expiration").get<int>();
    if (j.contains("max_signals_per_day"))
        max_signals_per_day = j.at("max_signals_per_day").get<int>();
    if (j.contains("profit_target_pct"))
        profit_target_pct = j.at("profit_target_pct").get<double>();
    if (j.contains("stop_loss_pct"))
        stop_loss_pct = j.at("stop_loss_pct").get<double>();
    if (j.contains("trend_lookback_days"))
        trend_lookback_days = j.at("trend_lookback_days").get<int>();
}

Result<void> LiquidityScreenConfig::validate() const {
    if (min_volume < 0 || min_open_interest < 0 || min_days_to_expiration < 0 ||
        trend_lookback_days < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Liquidity thresholds must be non-negative",
                                "LiquidityScreenStrategy");
    }
    if (max_signals_per_day < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_signals_per_day must be >= 1",
                                "LiquidityScreenStrategy");
    }
    if (profit_target_pct <= 0.0 || stop_loss_pct >= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "profit_target_pct must be positive and stop_loss_pct negative",
                                "LiquidityScreenStrategy");
    }
    return Result<void>();
}

LiquidityScreenStrategy::LiquidityScreenStrategy(std::string id, LiquidityScreenConfig config)
    : id_(std::move(id)), config_(std::move(config)) {
    Logger::register_component("LiquidityScreen");
}

Result<void> LiquidityScreenStrategy::initialize(std::shared_ptr<const PriceHistory> history) {
    if (config_.trend_lookback_days > 0 && !history) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Trend filter needs price history", "LiquidityScreenStrategy");
    }
    history_ = std::move(history);
    return Result<void>();
}

std::map<std::string, bool> LiquidityScreenStrategy::underlying_trends(
    const MarketSnapshot& snapshot) const {
    std::map<std::string, bool> trends;
    for (const auto& [symbol, chain] : snapshot.chains) {
        auto spot = snapshot.underlying_prices.find(symbol);
        if (spot == snapshot.underlying_prices.end() || spot->second <= 0.0) {
            WARN("No underlying price for " << symbol << ", skipping trend filter");
            continue;
        }
        auto average = history_->average_close(symbol, config_.trend_lookback_days);
        if (average.is_error()) {
            WARN("No trend for " << symbol << ": " << average.error()->what());
            continue;
        }
        trends[symbol] = spot->second >= average.value();
    }
    return trends;
}

bool LiquidityScreenStrategy::passes_screen(const OptionQuote& quote,
                                            const Timestamp& date) const {
    if (quote.mark_price() <= 0.0) {
        return false;
    }
    if (quote.volume < config_.min_volume || quote.open_interest < config_.min_open_interest) {
        return false;
    }
    if (quote.greeks && quote.greeks->implied_volatility < config_.min_implied_volatility) {
        return false;
    }
    if (quote.notional_value() < config_.min_notional_value) {
        return false;
    }
    return core::days_between(date, quote.expiration) >= config_.min_days_to_expiration;
}

Result<std::vector<Signal>> LiquidityScreenStrategy::generate_signals(
    const MarketSnapshot& snapshot, const Timestamp& date) {
    const bool use_trend = config_.trend_lookback_days > 0;
    if (use_trend && !history_) {
        return make_error<std::vector<Signal>>(ErrorCode::NOT_INITIALIZED,
                                               "Trend filter enabled before initialize()",
                                               "LiquidityScreenStrategy");
    }
    std::map<std::string, bool> trends;
    if (use_trend) {
        trends = underlying_trends(snapshot);
    }

    std::vector<const OptionQuote*> candidates;
    for (const auto& [symbol, chain] : snapshot.chains) {
        bool uptrend = false;
        if (use_trend) {
            auto trend = trends.find(symbol);
            if (trend == trends.end()) {
                continue;
            }
            uptrend = trend->second;
        }
        for (const auto& quote : chain) {
            if (!passes_screen(quote, date)) {
                continue;
            }
            if (use_trend && (quote.option_type == OptionType::CALL) != uptrend) {
                continue;
            }
            candidates.push_back(&quote);
        }
    }

    // Highest notional first; ties broken on contract fields so the order
    // does not depend on hash map iteration
    std::sort(candidates.begin(), candidates.end(),
              [](const OptionQuote* a, const OptionQuote* b) {
                  if (a->notional_value() != b->notional_value())
                      return a->notional_value() > b->notional_value();
                  if (a->symbol != b->symbol)
                      return a->symbol < b->symbol;
                  if (a->expiration != b->expiration)
                      return a->expiration < b->expiration;
                  if (a->strike != b->strike)
                      return a->strike < b->strike;
                  return a->option_type < b->option_type;
              });

    size_t limit = std::min(candidates.size(), static_cast<size_t>(config_.max_signals_per_day));
    std::vector<Signal> signals;
    signals.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        const OptionQuote& quote = *candidates[i];
        signals.push_back(
            {quote.symbol, quote.option_type, quote.strike, quote.expiration, quote.mark_price()});
    }

    if (!signals.empty()) {
        DEBUG(id_ << " generated " << signals.size() << " signals from " << candidates.size()
                  << " candidates on " << core::format_date(date));
    }
    return Result<std::vector<Signal>>(std::move(signals));
}

Result<std::optional<std::string>> LiquidityScreenStrategy::check_exit_criteria(
    const backtest::Position& position, const OptionQuote& quote, const Timestamp& /*date*/) {
    double mark = quote.mark_price();
    if (mark <= 0.0 || position.entry_price <= 0.0) {
        return Result<std::optional<std::string>>(std::nullopt);
    }

    double move_pct = (mark - position.entry_price) / position.entry_price * 100.0;
    if (move_pct >= config_.profit_target_pct) {
        return Result<std::optional<std::string>>(std::string("profit_target"));
    }
    if (move_pct <= config_.stop_loss_pct) {
        return Result<std::optional<std::string>>(std::string("stop_loss"));
    }
    return Result<std::optional<std::string>>(std::nullopt);
}

}  // namespace optsim
