// src/backtest/backtest_types.cpp

#include "optsim/backtest/backtest_types.hpp"

namespace optsim {
namespace backtest {

Result<void> BacktestConfig::validate() const {
    auto invalid = [](const std::string& msg) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, msg, "BacktestConfig");
    };

    if (symbols.empty()) {
        return invalid("At least one symbol is required");
    }
    for (const auto& symbol : symbols) {
        if (symbol.empty()) {
            return invalid("Symbols must not be empty strings");
        }
    }
    if (start_date > end_date) {
        return invalid("start_date " + core::format_date(start_date) + " is after end_date " +
                       core::format_date(end_date));
    }
    if (!(initial_capital > 0.0)) {
        return invalid("initial_capital must be positive");
    }
    if (max_positions < 1) {
        return invalid("max_positions must be at least 1");
    }
    if (!(position_size_pct > 0.0 && position_size_pct <= 1.0)) {
        return invalid("position_size_pct must be in (0, 1]");
    }
    if (commission_per_contract < 0.0) {
        return invalid("commission_per_contract must be non-negative");
    }
    if (!(slippage_pct >= 0.0 && slippage_pct < 1.0)) {
        return invalid("slippage_pct must be in [0, 1)");
    }
    if (fetch_timeout_ms <= 0) {
        return invalid("fetch_timeout_ms must be positive");
    }
    return Result<void>();
}

std::map<std::string, double> PerformanceMetrics::to_map() const {
    return {
        {"total_return_pct", total_return_pct},
        {"annualized_return_pct", annualized_return_pct},
        {"duration_years", duration_years},
        {"volatility_pct", volatility_pct},
        {"sharpe_ratio", sharpe_ratio},
        {"sortino_ratio", sortino_ratio},
        {"max_drawdown_pct", max_drawdown_pct},
        {"max_drawdown_duration_days", static_cast<double>(max_drawdown_duration_days)},
        {"total_trades", static_cast<double>(total_trades)},
        {"winning_trades", static_cast<double>(winning_trades)},
        {"losing_trades", static_cast<double>(losing_trades)},
        {"win_rate", win_rate},
        {"avg_profit_pct", avg_profit_pct},
        {"avg_profit_amount", avg_profit_amount},
        {"gross_profit", gross_profit},
        {"gross_loss", gross_loss},
        {"profit_factor", profit_factor},
        {"max_consecutive_wins", static_cast<double>(max_consecutive_wins)},
        {"max_consecutive_losses", static_cast<double>(max_consecutive_losses)},
        {"best_trade_pct", best_trade_pct},
        {"worst_trade_pct", worst_trade_pct},
        {"avg_trade_duration_days", avg_trade_duration_days},
    };
}

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j = to_map();
    j["symbol_pnl"] = symbol_pnl;
    return j;
}

nlohmann::json BacktestRun::summary_json() const {
    nlohmann::json j;
    j["run_id"] = run_id;
    j["strategy_id"] = strategy_id;
    j["symbols"] = symbols;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["initial_capital"] = initial_capital;
    j["final_capital"] = final_capital;
    j["status"] = run_status_to_string(status);
    if (failure_message) {
        j["failure_message"] = *failure_message;
    }
    j["trading_days"] = equity_curve.size();
    j["trade_count"] = trades.size();
    j["metrics"] = metrics.to_json();
    return j;
}

}  // namespace backtest
}  // namespace optsim
