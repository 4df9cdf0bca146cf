// src/backtest/position_ledger.cpp

#include "optsim/backtest/position_ledger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include "optsim/core/logger.hpp"
#include "optsim/core/time_utils.hpp"

namespace optsim {
namespace backtest {

namespace {

std::string describe(const std::string& symbol, OptionType type, double strike,
                     const Timestamp& expiration) {
    std::ostringstream ss;
    ss << symbol << " " << core::format_date(expiration) << " " << strike << " "
       << option_type_to_string(type);
    return ss.str();
}

}  // namespace

PositionLedger::PositionLedger(const PositionLedgerConfig& config, ErrorReporter* reporter)
    : config_(config),
      fill_model_(config.fill),
      reporter_(reporter),
      current_capital_(config.initial_capital) {}

void PositionLedger::reset() {
    current_capital_ = config_.initial_capital;
    realized_pnl_ = 0.0;
    next_position_id_ = 1;
    open_positions_.clear();
    closed_trades_.clear();
}

Result<Position> PositionLedger::open_position(const Signal& signal, const Timestamp& date) {
    if (signal.symbol.empty()) {
        return make_error<Position>(ErrorCode::INVALID_SIGNAL, "Signal has no symbol",
                                    "PositionLedger");
    }
    if (!(signal.strike > 0.0) || !(signal.price > 0.0)) {
        return make_error<Position>(
            ErrorCode::INVALID_SIGNAL,
            "Signal for " + signal.symbol + " has non-positive strike or price", "PositionLedger");
    }

    const std::string contract =
        describe(signal.symbol, signal.option_type, signal.strike, signal.expiration);

    double budget = current_capital_ * config_.position_size_pct;
    double sized = std::floor(budget / (signal.price * CONTRACT_MULTIPLIER));
    if (!(sized >= 1.0)) {
        return make_error<Position>(ErrorCode::INSUFFICIENT_FUNDS,
                                    "Budget " + std::to_string(budget) +
                                        " cannot buy one contract of " + contract,
                                    "PositionLedger");
    }
    int contracts = sized > static_cast<double>(std::numeric_limits<int>::max())
                        ? std::numeric_limits<int>::max()
                        : static_cast<int>(sized);

    Price fill = fill_model_.apply_slippage(signal.price, signal.option_type, FillSide::OPEN);
    double cost = fill_model_.entry_cost(fill, contracts);

    if (cost > current_capital_) {
        contracts = fill_model_.max_affordable_contracts(fill, current_capital_);
        if (contracts < 1) {
            return make_error<Position>(ErrorCode::INSUFFICIENT_FUNDS,
                                        "Capital " + std::to_string(current_capital_) +
                                            " cannot cover one contract of " + contract,
                                        "PositionLedger");
        }
        cost = fill_model_.entry_cost(fill, contracts);
    }

    Position position;
    position.position_id = next_position_id_++;
    position.symbol = signal.symbol;
    position.option_type = signal.option_type;
    position.strike = signal.strike;
    position.expiration = signal.expiration;
    position.entry_date = date;
    position.entry_price = fill;
    position.contracts = contracts;
    position.cost_basis = cost;
    position.current_price = fill;

    current_capital_ -= cost;
    open_positions_.push_back(position);

    DEBUG("Opened position " << position.position_id << ": " << contracts << " x " << contract
                             << " @ " << fill << ", cost " << cost << ", cash "
                             << current_capital_);
    return position;
}

std::vector<Position>::iterator PositionLedger::find_open(uint64_t position_id) {
    return std::find_if(open_positions_.begin(), open_positions_.end(),
                        [position_id](const Position& p) { return p.position_id == position_id; });
}

void PositionLedger::report_missing_quote(const Position& position, const Timestamp& date,
                                          const std::string& action) {
    std::string contract =
        describe(position.symbol, position.option_type, position.strike, position.expiration);
    WARN("No usable quote for " << contract << " on " << core::format_date(date) << ", "
                                << action);
    if (reporter_) {
        reporter_->report(BacktestErrorKind::MISSING_MARKET_QUOTE,
                          "No usable quote for " + contract + ", " + action, "PositionLedger",
                          {{"date", core::format_date(date)},
                           {"position_id", std::to_string(position.position_id)}},
                          ErrorCode::DATA_NOT_FOUND);
    }
}

ClosedTrade PositionLedger::settle(std::vector<Position>::iterator it, Price reference_price,
                                   const Timestamp& date, const std::string& reason) {
    Position& position = *it;

    Price fill = fill_model_.apply_slippage(reference_price, position.option_type,
                                            FillSide::CLOSE);
    double proceeds = fill_model_.exit_proceeds(fill, position.contracts);

    position.exit_date = date;
    position.exit_price = fill;
    position.exit_reason = reason;
    position.profit_loss = proceeds - position.cost_basis;
    position.profit_loss_pct =
        position.cost_basis > 0.0 ? position.profit_loss / position.cost_basis * 100.0 : 0.0;

    ClosedTrade trade;
    trade.position_id = position.position_id;
    trade.symbol = position.symbol;
    trade.option_type = position.option_type;
    trade.strike = position.strike;
    trade.expiration = position.expiration;
    trade.entry_date = position.entry_date;
    trade.entry_price = position.entry_price;
    trade.contracts = position.contracts;
    trade.cost_basis = position.cost_basis;
    trade.exit_date = date;
    trade.exit_price = fill;
    trade.exit_reason = reason;
    trade.profit_loss = position.profit_loss;
    trade.profit_loss_pct = position.profit_loss_pct;

    current_capital_ += proceeds;
    realized_pnl_ += trade.profit_loss;
    open_positions_.erase(it);
    closed_trades_.push_back(trade);

    DEBUG("Closed position " << trade.position_id << " (" << reason << ") @ " << fill
                             << ", P/L " << trade.profit_loss << ", cash " << current_capital_);
    return trade;
}

Result<ClosedTrade> PositionLedger::close_position(uint64_t position_id,
                                                   const MarketSnapshot& snapshot,
                                                   const Timestamp& date,
                                                   const std::string& reason) {
    auto it = find_open(position_id);
    if (it == open_positions_.end()) {
        return make_error<ClosedTrade>(ErrorCode::POSITION_NOT_FOUND,
                                       "No open position with id " + std::to_string(position_id),
                                       "PositionLedger");
    }

    const OptionQuote* quote =
        snapshot.find_quote(it->symbol, it->option_type, it->strike, it->expiration);
    Price reference_price = 0.0;
    if (quote && quote->mark_price() > 0.0) {
        reference_price = quote->mark_price();
    } else {
        reference_price = it->current_price;
        report_missing_quote(*it, date, "closing at last known price " +
                                            std::to_string(reference_price));
    }

    return settle(it, reference_price, date, reason);
}

Result<std::vector<ClosedTrade>> PositionLedger::evaluate_exits(const MarketSnapshot& snapshot,
                                                                const Timestamp& date,
                                                                OptionsStrategy& strategy) {
    std::vector<ClosedTrade> closed;

    std::vector<uint64_t> ids;
    ids.reserve(open_positions_.size());
    for (const auto& position : open_positions_) {
        ids.push_back(position.position_id);
    }

    for (uint64_t id : ids) {
        auto it = find_open(id);
        if (it == open_positions_.end()) {
            continue;
        }

        const OptionQuote* quote =
            snapshot.find_quote(it->symbol, it->option_type, it->strike, it->expiration);
        if (!quote) {
            report_missing_quote(*it, date, "carrying position forward");
            continue;
        }

        if (quote->mark_price() > 0.0) {
            it->current_price = quote->mark_price();
            it->last_mark_date = date;
        }

        auto exit_result = strategy.check_exit_criteria(*it, *quote, date);
        if (exit_result.is_error()) {
            return make_error<std::vector<ClosedTrade>>(
                ErrorCode::STRATEGY_ERROR,
                "Exit check failed for position " + std::to_string(id) + ": " +
                    exit_result.error()->what(),
                "PositionLedger");
        }

        std::optional<std::string> reason = exit_result.value();
        if (!reason && it->expiration <= date) {
            reason = "expiration";
        }
        if (!reason) {
            continue;
        }

        auto close_result = close_position(id, snapshot, date, *reason);
        if (close_result.is_error()) {
            return make_error<std::vector<ClosedTrade>>(close_result.error()->code(),
                                                        close_result.error()->what(),
                                                        "PositionLedger");
        }
        closed.push_back(close_result.value());
    }

    return closed;
}

Result<std::vector<ClosedTrade>> PositionLedger::close_all(const MarketSnapshot& snapshot,
                                                           const Timestamp& date,
                                                           const std::string& reason) {
    std::vector<ClosedTrade> closed;
    while (!open_positions_.empty()) {
        auto close_result =
            close_position(open_positions_.front().position_id, snapshot, date, reason);
        if (close_result.is_error()) {
            return make_error<std::vector<ClosedTrade>>(close_result.error()->code(),
                                                        close_result.error()->what(),
                                                        "PositionLedger");
        }
        closed.push_back(close_result.value());
    }
    return closed;
}

void PositionLedger::mark_to_market(const MarketSnapshot& snapshot, const Timestamp& date) {
    for (auto& position : open_positions_) {
        const OptionQuote* quote = snapshot.find_quote(position.symbol, position.option_type,
                                                       position.strike, position.expiration);
        if (quote && quote->mark_price() > 0.0) {
            position.current_price = quote->mark_price();
            position.last_mark_date = date;
        }
    }
}

double PositionLedger::positions_value() const {
    double value = 0.0;
    for (const auto& position : open_positions_) {
        value += position.market_value();
    }
    return value;
}

EquityPoint PositionLedger::equity_point(const Timestamp& date) const {
    EquityPoint point;
    point.date = date;
    point.cash = current_capital_;
    point.positions_value = positions_value();
    point.total_equity = point.cash + point.positions_value;
    return point;
}

double PositionLedger::capital_drift() const {
    double open_basis = 0.0;
    for (const auto& position : open_positions_) {
        open_basis += position.cost_basis;
    }
    return current_capital_ + open_basis - (config_.initial_capital + realized_pnl_);
}

Result<void> PositionLedger::check_capital_conservation(double tolerance) const {
    if (tolerance < 0.0) {
        tolerance = 1e-6 * std::max(1.0, config_.initial_capital);
    }

    double drift = capital_drift();
    if (std::abs(drift) > tolerance) {
        return make_error<void>(ErrorCode::CAPITAL_INVARIANT_VIOLATION,
                                "Capital conservation violated, drift " + std::to_string(drift),
                                "PositionLedger");
    }
    if (current_capital_ < -tolerance) {
        return make_error<void>(ErrorCode::CAPITAL_INVARIANT_VIOLATION,
                                "Cash went negative: " + std::to_string(current_capital_),
                                "PositionLedger");
    }
    return Result<void>();
}

}  // namespace backtest
}  // namespace optsim
