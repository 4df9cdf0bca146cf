#include "optsim/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include "optsim/core/time_utils.hpp"

namespace optsim {
namespace backtest {

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return_pct(double initial_capital,
                                                             double final_capital) const {
    if (initial_capital <= 0.0) {
        return 0.0;
    }
    return (final_capital - initial_capital) / initial_capital * 100.0;
}

double BacktestMetricsCalculator::calculate_duration_years(
    const std::vector<EquityPoint>& equity_curve) const {
    if (equity_curve.size() < 2) {
        return 0.0;
    }
    auto days = core::days_between(equity_curve.front().date, equity_curve.back().date);
    return static_cast<double>(days) / 365.0;
}

double BacktestMetricsCalculator::calculate_annualized_return_pct(double total_return_pct,
                                                                  double duration_years) const {
    if (duration_years <= 0.0) {
        return 0.0;
    }
    double growth = 1.0 + total_return_pct / 100.0;
    if (growth <= 0.0) {
        return -100.0;
    }
    return (std::pow(growth, 1.0 / duration_years) - 1.0) * 100.0;
}

std::vector<double> BacktestMetricsCalculator::calculate_daily_returns(
    const std::vector<EquityPoint>& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        double previous = equity_curve[i - 1].total_equity;
        if (previous > 0.0) {
            returns.push_back((equity_curve[i].total_equity - previous) / previous);
        }
    }
    return returns;
}

// ========== Risk-Adjusted Return Metrics ==========

double BacktestMetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    double mean = calculate_mean(returns);
    double std_dev = calculate_sample_std(returns, mean);
    if (std_dev <= 0.0) {
        return 0.0;
    }
    return std::sqrt(TRADING_DAYS_PER_YEAR) * mean / std_dev;
}

double BacktestMetricsCalculator::calculate_sortino_ratio(const std::vector<double>& returns) const {
    std::vector<double> negative;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(negative),
                 [](double r) { return r < 0.0; });
    if (negative.size() < 2) {
        return 0.0;
    }

    double downside = calculate_sample_std(negative, calculate_mean(negative));
    if (downside <= 0.0) {
        return 0.0;
    }
    return std::sqrt(TRADING_DAYS_PER_YEAR) * calculate_mean(returns) / downside;
}

double BacktestMetricsCalculator::calculate_volatility_pct(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    return calculate_sample_std(returns, calculate_mean(returns)) *
           std::sqrt(TRADING_DAYS_PER_YEAR) * 100.0;
}

// ========== Drawdown Metrics ==========

std::vector<double> BacktestMetricsCalculator::calculate_drawdowns(
    const std::vector<EquityPoint>& equity_curve) const {
    std::vector<double> drawdowns;
    drawdowns.reserve(equity_curve.size());
    if (equity_curve.empty()) {
        return drawdowns;
    }

    double peak = equity_curve.front().total_equity;
    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.total_equity);
        double drawdown = 0.0;
        if (peak > 0.0 && point.total_equity < peak) {
            drawdown = (point.total_equity - peak) / peak;
        }
        drawdowns.push_back(drawdown);
    }
    return drawdowns;
}

double BacktestMetricsCalculator::calculate_max_drawdown_pct(
    const std::vector<EquityPoint>& equity_curve) const {
    auto drawdowns = calculate_drawdowns(equity_curve);
    if (drawdowns.empty()) {
        return 0.0;
    }
    return *std::min_element(drawdowns.begin(), drawdowns.end()) * 100.0;
}

int64_t BacktestMetricsCalculator::calculate_max_drawdown_duration_days(
    const std::vector<EquityPoint>& equity_curve) const {
    if (equity_curve.empty()) {
        return 0;
    }

    int64_t longest = 0;
    double peak = equity_curve.front().total_equity;
    const EquityPoint* period_start = nullptr;

    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.total_equity);
        bool underwater = point.total_equity < peak;
        if (underwater && !period_start) {
            period_start = &point;
        } else if (!underwater && period_start) {
            longest = std::max(longest, core::days_between(period_start->date, point.date));
            period_start = nullptr;
        }
    }

    if (period_start) {
        longest =
            std::max(longest, core::days_between(period_start->date, equity_curve.back().date));
    }
    return longest;
}

// ========== Trade Statistics ==========

double BacktestMetricsCalculator::calculate_profit_factor(double gross_profit,
                                                          double gross_loss) const {
    if (gross_profit <= 0.0) {
        return 0.0;
    }
    if (gross_loss <= 0.0) {
        return PROFIT_FACTOR_CAP;
    }
    return std::min(gross_profit / gross_loss, PROFIT_FACTOR_CAP);
}

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<ClosedTrade>& trades) const {
    TradeStatistics stats;
    if (trades.empty()) {
        return stats;
    }

    stats.total_trades = static_cast<int>(trades.size());
    stats.best_trade_pct = trades.front().profit_loss_pct;
    stats.worst_trade_pct = trades.front().profit_loss_pct;

    double sum_pct = 0.0;
    double sum_amount = 0.0;
    double sum_duration = 0.0;
    int win_streak = 0;
    int loss_streak = 0;

    for (const auto& trade : trades) {
        sum_pct += trade.profit_loss_pct;
        sum_amount += trade.profit_loss;
        sum_duration += static_cast<double>(trade.holding_days());
        stats.best_trade_pct = std::max(stats.best_trade_pct, trade.profit_loss_pct);
        stats.worst_trade_pct = std::min(stats.worst_trade_pct, trade.profit_loss_pct);

        if (trade.profit_loss > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += trade.profit_loss;
            win_streak++;
            loss_streak = 0;
        } else {
            stats.losing_trades++;
            stats.gross_loss += -trade.profit_loss;
            loss_streak++;
            win_streak = 0;
        }
        stats.max_consecutive_wins = std::max(stats.max_consecutive_wins, win_streak);
        stats.max_consecutive_losses = std::max(stats.max_consecutive_losses, loss_streak);
    }

    double count = static_cast<double>(stats.total_trades);
    stats.win_rate = stats.winning_trades / count * 100.0;
    stats.avg_profit_pct = sum_pct / count;
    stats.avg_profit_amount = sum_amount / count;
    stats.avg_trade_duration_days = sum_duration / count;
    stats.profit_factor = calculate_profit_factor(stats.gross_profit, stats.gross_loss);
    return stats;
}

std::map<std::string, double> BacktestMetricsCalculator::calculate_symbol_pnl(
    const std::vector<ClosedTrade>& trades) const {
    std::map<std::string, double> symbol_pnl;
    for (const auto& trade : trades) {
        symbol_pnl[trade.symbol] += trade.profit_loss;
    }
    return symbol_pnl;
}

// ========== Composite Calculation ==========

PerformanceMetrics BacktestMetricsCalculator::calculate_all_metrics(
    double initial_capital, double final_capital, const std::vector<EquityPoint>& equity_curve,
    const std::vector<ClosedTrade>& trades) const {
    PerformanceMetrics metrics;

    metrics.total_return_pct = calculate_total_return_pct(initial_capital, final_capital);
    metrics.duration_years = calculate_duration_years(equity_curve);
    metrics.annualized_return_pct =
        calculate_annualized_return_pct(metrics.total_return_pct, metrics.duration_years);

    auto returns = calculate_daily_returns(equity_curve);
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns);
    metrics.sortino_ratio = calculate_sortino_ratio(returns);
    metrics.volatility_pct = calculate_volatility_pct(returns);

    metrics.max_drawdown_pct = calculate_max_drawdown_pct(equity_curve);
    metrics.max_drawdown_duration_days = calculate_max_drawdown_duration_days(equity_curve);

    auto stats = calculate_trade_statistics(trades);
    metrics.total_trades = stats.total_trades;
    metrics.winning_trades = stats.winning_trades;
    metrics.losing_trades = stats.losing_trades;
    metrics.win_rate = stats.win_rate;
    metrics.avg_profit_pct = stats.avg_profit_pct;
    metrics.avg_profit_amount = stats.avg_profit_amount;
    metrics.gross_profit = stats.gross_profit;
    metrics.gross_loss = stats.gross_loss;
    metrics.profit_factor = stats.profit_factor;
    metrics.max_consecutive_wins = stats.max_consecutive_wins;
    metrics.max_consecutive_losses = stats.max_consecutive_losses;
    metrics.best_trade_pct = stats.best_trade_pct;
    metrics.worst_trade_pct = stats.worst_trade_pct;
    metrics.avg_trade_duration_days = stats.avg_trade_duration_days;

    metrics.symbol_pnl = calculate_symbol_pnl(trades);
    return metrics;
}

// ========== Helper Methods ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double BacktestMetricsCalculator::calculate_sample_std(const std::vector<double>& values,
                                                       double mean) const {
    if (values.size() < 2) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

}  // namespace backtest
}  // namespace optsim
