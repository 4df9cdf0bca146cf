#pragma once

#include <map>
#include <string>
#include <vector>
#include "optsim/backtest/backtest_types.hpp"
#include "optsim/core/types.hpp"

namespace optsim {
namespace backtest {

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * All methods are const and deterministic: the same capital figures,
 * equity curve and trades always yield the same metrics.
 *
 * Conventions:
 * - Daily returns are fractions (0.01 = 1%), everything reported in
 *   PerformanceMetrics is in percent
 * - Standard deviations are sample deviations (n - 1)
 * - Annualization uses 252 trading days, durations use 365 calendar days
 */
class BacktestMetricsCalculator {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    static constexpr double PROFIT_FACTOR_CAP = 999.0;

    BacktestMetricsCalculator() = default;
    ~BacktestMetricsCalculator() = default;

    // ========== Return Calculations ==========

    /**
     * @brief (final - initial) / initial x 100, 0 when initial <= 0
     */
    double calculate_total_return_pct(double initial_capital, double final_capital) const;

    /**
     * @brief Calendar days between first and last equity point / 365
     */
    double calculate_duration_years(const std::vector<EquityPoint>& equity_curve) const;

    /**
     * @brief Compound annual growth rate in percent
     * @return 0 for a zero-length run, -100 if the capital was wiped out
     */
    double calculate_annualized_return_pct(double total_return_pct, double duration_years) const;

    /**
     * @brief Percent change of total equity between consecutive points
     *
     * Steps whose previous equity is not positive are skipped.
     */
    std::vector<double> calculate_daily_returns(
        const std::vector<EquityPoint>& equity_curve) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief sqrt(252) x mean / std of daily returns, risk-free rate 0
     * @return 0 with fewer than two returns or zero deviation
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns) const;

    /**
     * @brief sqrt(252) x mean of all returns / std of the negative ones
     * @return 0 with fewer than two negative returns or zero deviation
     */
    double calculate_sortino_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Annualized volatility of daily returns in percent
     */
    double calculate_volatility_pct(const std::vector<double>& returns) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief (equity - running max) / running max per point, always <= 0
     */
    std::vector<double> calculate_drawdowns(const std::vector<EquityPoint>& equity_curve) const;

    /**
     * @brief Deepest drawdown in percent (<= 0)
     */
    double calculate_max_drawdown_pct(const std::vector<EquityPoint>& equity_curve) const;

    /**
     * @brief Longest underwater period in calendar days
     *
     * A period starts at the first point below the running maximum and ends
     * at the point that regains it, or at the last point if it never does.
     */
    int64_t calculate_max_drawdown_duration_days(
        const std::vector<EquityPoint>& equity_curve) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double avg_profit_pct = 0.0;
        double avg_profit_amount = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double profit_factor = 0.0;
        int max_consecutive_wins = 0;
        int max_consecutive_losses = 0;
        double best_trade_pct = 0.0;
        double worst_trade_pct = 0.0;
        double avg_trade_duration_days = 0.0;
    };

    /**
     * @brief Trade statistics in close order; a trade wins iff profit_loss > 0
     */
    TradeStatistics calculate_trade_statistics(const std::vector<ClosedTrade>& trades) const;

    /**
     * @brief gross_profit / gross_loss, capped at PROFIT_FACTOR_CAP
     *
     * A run with profit and no losses scores the cap; a run without profit
     * scores 0.
     */
    double calculate_profit_factor(double gross_profit, double gross_loss) const;

    /**
     * @brief Realized P/L per underlying symbol
     */
    std::map<std::string, double> calculate_symbol_pnl(
        const std::vector<ClosedTrade>& trades) const;

    // ========== Composite Calculation ==========

    PerformanceMetrics calculate_all_metrics(double initial_capital, double final_capital,
                                             const std::vector<EquityPoint>& equity_curve,
                                             const std::vector<ClosedTrade>& trades) const;

private:
    double calculate_mean(const std::vector<double>& values) const;

    /**
     * @brief Sample standard deviation, 0 with fewer than two values
     */
    double calculate_sample_std(const std::vector<double>& values, double mean) const;
};

}  // namespace backtest
}  // namespace optsim
