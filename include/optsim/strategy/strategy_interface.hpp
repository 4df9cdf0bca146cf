// include/optsim/strategy/strategy_interface.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "optsim/backtest/backtest_types.hpp"
#include "optsim/core/error.hpp"
#include "optsim/core/types.hpp"
#include "optsim/data/price_history.hpp"

namespace optsim {

/**
 * @brief Interface for all options strategies driven by the backtester
 */
class OptionsStrategy {
public:
    virtual ~OptionsStrategy() = default;

    /**
     * @brief Stable identifier, used for logging and run ids
     */
    virtual std::string get_id() const = 0;

    /**
     * @brief Called once before the first trading day of a run
     * @param history Underlying closes up to the current trading day
     */
    virtual Result<void> initialize(std::shared_ptr<const PriceHistory> history) {
        (void)history;
        return Result<void>();
    }

    /**
     * @brief Entry candidates for the day, best first
     * @param snapshot Market data known on the day
     * @param date Current trading day
     */
    virtual Result<std::vector<Signal>> generate_signals(const MarketSnapshot& snapshot,
                                                         const Timestamp& date) = 0;

    /**
     * @brief Decide whether an open position should be closed
     * @param position The open position, already marked to the quote
     * @param quote Today's quote for the position's contract
     * @param date Current trading day
     * @return Exit reason, or std::nullopt to keep holding
     */
    virtual Result<std::optional<std::string>> check_exit_criteria(
        const backtest::Position& position, const OptionQuote& quote, const Timestamp& date) = 0;
};

}  // namespace optsim
