// include/optsim/backtest/position_ledger.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "optsim/backtest/backtest_types.hpp"
#include "optsim/backtest/fill_model.hpp"
#include "optsim/core/error.hpp"
#include "optsim/core/error_reporter.hpp"
#include "optsim/core/types.hpp"
#include "optsim/strategy/strategy_interface.hpp"

namespace optsim {
namespace backtest {

struct PositionLedgerConfig {
    double initial_capital = 100000.0;
    double position_size_pct = 0.1;
    FillModelConfig fill;
};

/**
 * @brief Cash and position bookkeeping for a single run
 *
 * Owns every open position exclusively. All mutations keep
 *   cash + sum(open cost basis) == initial capital + realized P/L
 * and never drive cash below zero.
 */
class PositionLedger {
public:
    /**
     * @param config Capital, sizing and fill settings
     * @param reporter Optional sink for MISSING_MARKET_QUOTE reports; not
     *        owned
     */
    explicit PositionLedger(const PositionLedgerConfig& config,
                            ErrorReporter* reporter = nullptr);

    /**
     * @brief Size, fill and book a new long position
     *
     * Contracts are floor(capital * position_size_pct / (price * 100)). When
     * slippage and commission push the cost past the available cash the count
     * is reduced to the largest affordable one.
     *
     * @return The opened position, INVALID_SIGNAL for malformed signals or
     *         INSUFFICIENT_FUNDS when not even one contract fits
     */
    Result<Position> open_position(const Signal& signal, const Timestamp& date);

    /**
     * @brief Close an open position at the snapshot's mark
     *
     * If the contract is not quoted (or has no usable mark) the position's
     * last known price is used and a MISSING_MARKET_QUOTE is reported.
     */
    Result<ClosedTrade> close_position(uint64_t position_id, const MarketSnapshot& snapshot,
                                       const Timestamp& date, const std::string& reason);

    /**
     * @brief Apply exit rules to every open position
     *
     * Positions without a quote today are carried forward untouched, even
     * past expiration. Otherwise the position is marked, then closed when the
     * strategy's exit criterion fires or when it has expired.
     *
     * @return Trades closed today, or the strategy's error
     */
    Result<std::vector<ClosedTrade>> evaluate_exits(const MarketSnapshot& snapshot,
                                                    const Timestamp& date,
                                                    OptionsStrategy& strategy);

    /**
     * @brief Close every open position with the given reason
     */
    Result<std::vector<ClosedTrade>> close_all(const MarketSnapshot& snapshot,
                                               const Timestamp& date,
                                               const std::string& reason);

    /**
     * @brief Update current_price of quoted positions to today's mark
     */
    void mark_to_market(const MarketSnapshot& snapshot, const Timestamp& date);

    /**
     * @brief Sum of current_price x 100 x contracts over open positions
     */
    double positions_value() const;

    EquityPoint equity_point(const Timestamp& date) const;

    double current_capital() const {
        return current_capital_;
    }

    double initial_capital() const {
        return config_.initial_capital;
    }

    double realized_pnl() const {
        return realized_pnl_;
    }

    const std::vector<Position>& open_positions() const {
        return open_positions_;
    }

    size_t open_position_count() const {
        return open_positions_.size();
    }

    const std::vector<ClosedTrade>& closed_trades() const {
        return closed_trades_;
    }

    /**
     * @brief cash + open cost basis - (initial capital + realized P/L)
     */
    double capital_drift() const;

    /**
     * @brief Verify the conservation identity and non-negative cash
     * @param tolerance Allowed absolute residual; a negative value selects
     *        1e-6 x max(1, initial capital)
     * @return CAPITAL_INVARIANT_VIOLATION on failure
     */
    Result<void> check_capital_conservation(double tolerance = -1.0) const;

    const FillModel& fill_model() const {
        return fill_model_;
    }

    void reset();

private:
    std::vector<Position>::iterator find_open(uint64_t position_id);
    ClosedTrade settle(std::vector<Position>::iterator it, Price reference_price,
                       const Timestamp& date, const std::string& reason);
    void report_missing_quote(const Position& position, const Timestamp& date,
                              const std::string& action);

    PositionLedgerConfig config_;
    FillModel fill_model_;
    ErrorReporter* reporter_;

    double current_capital_;
    double realized_pnl_{0.0};
    uint64_t next_position_id_{1};
    std::vector<Position> open_positions_;
    std::vector<ClosedTrade> closed_trades_;
};

}  // namespace backtest
}  // namespace optsim
