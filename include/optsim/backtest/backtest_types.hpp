// include/optsim/backtest/backtest_types.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "optsim/core/config_base.hpp"
#include "optsim/core/error.hpp"
#include "optsim/core/time_utils.hpp"
#include "optsim/core/types.hpp"

namespace optsim {
namespace backtest {

/**
 * @brief Simulation parameters for one backtest run
 */
struct BacktestConfig : public ConfigBase {
    std::vector<std::string> symbols;
    Timestamp start_date;
    Timestamp end_date;
    double initial_capital{100000.0};
    int max_positions{5};
    double position_size_pct{0.1};         // Fraction of current capital per entry
    double commission_per_contract{0.65};
    double slippage_pct{0.01};             // 0.01 = 1%

    // Snapshot fetching
    bool parallel_fetch{true};
    int fetch_timeout_ms{30000};

    /**
     * @brief Check parameter ranges before a run starts
     * @return INVALID_ARGUMENT describing the first offending field
     */
    Result<void> validate() const override;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["symbols"] = symbols;
        j["start_date"] = core::format_date(start_date);
        j["end_date"] = core::format_date(end_date);
        j["initial_capital"] = initial_capital;
        j["max_positions"] = max_positions;
        j["position_size_pct"] = position_size_pct;
        j["commission_per_contract"] = commission_per_contract;
        j["slippage_pct"] = slippage_pct;
        j["parallel_fetch"] = parallel_fetch;
        j["fetch_timeout_ms"] = fetch_timeout_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("symbols"))
            symbols = j.at("symbols").get<std::vector<std::string>>();
        if (j.contains("start_date"))
            start_date = core::parse_date(j.at("start_date").get<std::string>()).value();
        if (j.contains("end_date"))
            end_date = core::parse_date(j.at("end_date").get<std::string>()).value();
        if (j.contains("initial_capital"))
            initial_capital = j.at("initial_capital").get<double>();
        if (j.contains("max_positions"))
            max_positions = j.at("max_positions").get<int>();
        if (j.contains("position_size_pct"))
            position_size_pct = j.at("position_size_pct").get<double>();
        if (j.contains("commission_per_contract"))
            commission_per_contract = j.at("commission_per_contract").get<double>();
        if (j.contains("slippage_pct"))
            slippage_pct = j.at("slippage_pct").get<double>();
        if (j.contains("parallel_fetch"))
            parallel_fetch = j.at("parallel_fetch").get<bool>();
        if (j.contains("fetch_timeout_ms"))
            fetch_timeout_ms = j.at("fetch_timeout_ms").get<int>();
    }
};

/**
 * @brief A long option position held by the ledger
 *
 * Exit fields are populated only once the position has been closed.
 */
struct Position {
    uint64_t position_id{0};
    std::string symbol;
    OptionType option_type{OptionType::CALL};
    double strike{0.0};
    Timestamp expiration;
    Timestamp entry_date;
    Price entry_price{0.0};  // Fill after slippage
    int contracts{0};
    double cost_basis{0.0};  // Includes entry commission
    Price current_price{0.0};
    std::optional<Timestamp> last_mark_date;

    std::optional<Timestamp> exit_date;
    std::optional<Price> exit_price;
    std::optional<std::string> exit_reason;
    double profit_loss{0.0};
    double profit_loss_pct{0.0};

    bool is_closed() const {
        return exit_date.has_value();
    }

    double market_value() const {
        return current_price * CONTRACT_MULTIPLIER * contracts;
    }
};

/**
 * @brief Immutable record of a position at the moment it was closed
 */
struct ClosedTrade {
    uint64_t position_id{0};
    std::string symbol;
    OptionType option_type{OptionType::CALL};
    double strike{0.0};
    Timestamp expiration;
    Timestamp entry_date;
    Price entry_price{0.0};
    int contracts{0};
    double cost_basis{0.0};
    Timestamp exit_date;
    Price exit_price{0.0};
    std::string exit_reason;
    double profit_loss{0.0};
    double profit_loss_pct{0.0};

    int64_t holding_days() const {
        return core::days_between(entry_date, exit_date);
    }
};

struct EquityPoint {
    Timestamp date;
    double cash{0.0};
    double positions_value{0.0};
    double total_equity{0.0};
};

/**
 * @brief Return, risk and trade analytics of a finished run
 *
 * Percentages are expressed in percent (12.5 = 12.5%).
 */
struct PerformanceMetrics {
    // Returns
    double total_return_pct{0.0};
    double annualized_return_pct{0.0};
    double duration_years{0.0};
    double volatility_pct{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};

    // Drawdown
    double max_drawdown_pct{0.0};
    int64_t max_drawdown_duration_days{0};

    // Trades
    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    double win_rate{0.0};
    double avg_profit_pct{0.0};
    double avg_profit_amount{0.0};
    double gross_profit{0.0};
    double gross_loss{0.0};
    double profit_factor{0.0};
    int max_consecutive_wins{0};
    int max_consecutive_losses{0};
    double best_trade_pct{0.0};
    double worst_trade_pct{0.0};
    double avg_trade_duration_days{0.0};

    std::map<std::string, double> symbol_pnl;

    /**
     * @brief Flatten scalar metrics into name -> value pairs
     */
    std::map<std::string, double> to_map() const;

    nlohmann::json to_json() const;
};

enum class RunStatus {
    RUNNING,
    COMPLETED,
    FAILED
};

inline std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::RUNNING:
            return "RUNNING";
        case RunStatus::COMPLETED:
            return "COMPLETED";
        case RunStatus::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Everything produced by one backtest
 */
struct BacktestRun {
    std::string run_id;  // Assigned by the results sink
    std::string strategy_id;
    std::vector<std::string> symbols;
    Timestamp start_date;
    Timestamp end_date;
    double initial_capital{0.0};
    double final_capital{0.0};
    RunStatus status{RunStatus::RUNNING};
    std::optional<std::string> failure_message;
    std::vector<EquityPoint> equity_curve;
    std::vector<ClosedTrade> trades;
    PerformanceMetrics metrics;

    /**
     * @brief Summary fields and metrics (no trades or equity curve)
     */
    nlohmann::json summary_json() const;
};

}  // namespace backtest
}  // namespace optsim
