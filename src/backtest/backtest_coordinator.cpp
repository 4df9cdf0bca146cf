#include "optsim/backtest/backtest_coordinator.hpp"
#include "optsim/backtest/trading_calendar.hpp"
#include "optsim/core/logger.hpp"
#include "optsim/core/time_utils.hpp"

namespace optsim {
namespace backtest {

BacktestCoordinator::BacktestCoordinator(std::shared_ptr<MarketDataProvider> provider,
                                         std::vector<std::shared_ptr<ResultsSink>> sinks,
                                         std::shared_ptr<ErrorReporter> reporter)
    : provider_(std::move(provider)),
      sinks_(std::move(sinks)),
      reporter_(reporter ? std::move(reporter) : std::make_shared<ErrorReporter>()),
      metrics_calculator_(std::make_unique<BacktestMetricsCalculator>()) {
    if (!provider_) {
        throw std::invalid_argument("BacktestCoordinator requires a market data provider");
    }
    Logger::register_component("BacktestCoordinator");
}

BacktestCoordinator::~BacktestCoordinator() = default;

void BacktestCoordinator::add_sink(std::shared_ptr<ResultsSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

Result<BacktestRun> BacktestCoordinator::run(const BacktestConfig& config,
                                             std::shared_ptr<OptionsStrategy> strategy) {
    if (!strategy) {
        return make_error<BacktestRun>(ErrorCode::INVALID_ARGUMENT, "Strategy is required",
                                       "BacktestCoordinator");
    }
    auto validation = config.validate();
    if (validation.is_error()) {
        ERROR("Invalid backtest configuration: " << validation.error()->what());
        return make_error<BacktestRun>(validation.error()->code(), validation.error()->what(),
                                       "BacktestCoordinator");
    }

    // Fresh state for this run
    PositionLedgerConfig ledger_config;
    ledger_config.initial_capital = config.initial_capital;
    ledger_config.position_size_pct = config.position_size_pct;
    ledger_config.fill.commission_per_contract = config.commission_per_contract;
    ledger_config.fill.slippage_pct = config.slippage_pct;
    ledger_ = std::make_unique<PositionLedger>(ledger_config, reporter_.get());

    SnapshotFetcherConfig fetch_config;
    fetch_config.parallel_fetch = config.parallel_fetch;
    fetch_config.timeout = std::chrono::milliseconds(config.fetch_timeout_ms);
    SnapshotFetcher fetcher(provider_, fetch_config);
    auto history = std::make_shared<PriceHistory>(provider_);

    current_run_ = BacktestRun();
    current_run_.strategy_id = strategy->get_id();
    current_run_.symbols = config.symbols;
    current_run_.start_date = config.start_date;
    current_run_.end_date = config.end_date;
    current_run_.initial_capital = config.initial_capital;
    current_run_.final_capital = config.initial_capital;
    current_run_.status = RunStatus::RUNNING;
    last_run_.reset();

    std::vector<Timestamp> days = TradingCalendar::trading_days(config.start_date,
                                                                config.end_date);
    INFO("Starting backtest of " << current_run_.strategy_id << " on "
                                 << config.symbols.size() << " symbols over " << days.size()
                                 << " trading days (" << core::format_date(config.start_date)
                                 << " to " << core::format_date(config.end_date) << ")");

    MarketSnapshot final_snapshot;
    final_snapshot.date = days.empty() ? config.end_date : days.back();

    history->set_as_of(config.start_date);
    try {
        auto init_result = strategy->initialize(history);
        if (init_result.is_error()) {
            return fail_run(init_result.error()->code(),
                            "Strategy " + current_run_.strategy_id +
                                " failed to initialize: " + init_result.error()->what(),
                            config.start_date);
        }
    } catch (const std::exception& e) {
        return fail_run(ErrorCode::STRATEGY_ERROR,
                        std::string("Exception initializing strategy: ") + e.what(),
                        config.start_date);
    }

    for (const auto& date : days) {
        Logger::instance().set_trading_date(core::format_date(date));
        history->set_as_of(date);
        try {
            SnapshotFetchResult fetched = fetcher.fetch(config.symbols, date);
            report_fetch_failures(fetched.failures, date);

            auto day_result = process_day(date, fetched.snapshot, *strategy, config);
            if (day_result.is_error()) {
                return fail_run(day_result.error()->code(), day_result.error()->what(), date);
            }
            final_snapshot = std::move(fetched.snapshot);

        } catch (const std::exception& e) {
            return fail_run(ErrorCode::ORCHESTRATION_ERROR,
                            std::string("Exception during day step: ") + e.what(), date);
        }
    }

    // Force-close stragglers with the final trading day's quotes
    try {
        if (!days.empty() && ledger_->open_position_count() > 0) {
            auto closed = ledger_->close_all(final_snapshot, days.back(), "end_of_backtest");
            if (closed.is_error()) {
                return fail_run(closed.error()->code(), closed.error()->what(), days.back());
            }
            INFO("Force-closed " << closed.value().size() << " positions at end of backtest");

            auto conservation = ledger_->check_capital_conservation();
            if (conservation.is_error()) {
                return fail_run(conservation.error()->code(), conservation.error()->what(),
                                days.back());
            }
        }
    } catch (const std::exception& e) {
        return fail_run(ErrorCode::ORCHESTRATION_ERROR,
                        std::string("Exception during final close: ") + e.what(),
                        final_snapshot.date);
    }

    finalize_run(RunStatus::COMPLETED, std::nullopt);

    INFO("Backtest " << current_run_.strategy_id << " completed: "
                     << current_run_.metrics.total_trades << " trades, total return "
                     << current_run_.metrics.total_return_pct << "%, final capital "
                     << current_run_.final_capital);

    persist_results(current_run_);
    last_run_ = current_run_;
    return Result<BacktestRun>(current_run_);
}

Result<void> BacktestCoordinator::process_day(const Timestamp& date,
                                              const MarketSnapshot& snapshot,
                                              OptionsStrategy& strategy,
                                              const BacktestConfig& config) {
    if (!ledger_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "No run in progress",
                                "BacktestCoordinator");
    }

    // Exits first so freed capital is available to today's entries
    auto exits = ledger_->evaluate_exits(snapshot, date, strategy);
    if (exits.is_error()) {
        return make_error<void>(exits.error()->code(), exits.error()->what(),
                                "BacktestCoordinator");
    }

    if (ledger_->open_position_count() < static_cast<size_t>(config.max_positions)) {
        auto signals = strategy.generate_signals(snapshot, date);
        if (signals.is_error()) {
            return make_error<void>(ErrorCode::STRATEGY_ERROR,
                                    "Strategy " + strategy.get_id() +
                                        " failed to generate signals: " +
                                        signals.error()->what(),
                                    "BacktestCoordinator");
        }
        open_new_positions(signals.value(), date, config);
    }

    ledger_->mark_to_market(snapshot, date);
    current_run_.equity_curve.push_back(ledger_->equity_point(date));

    return ledger_->check_capital_conservation();
}

void BacktestCoordinator::open_new_positions(const std::vector<Signal>& signals,
                                             const Timestamp& date,
                                             const BacktestConfig& config) {
    const size_t capacity = static_cast<size_t>(config.max_positions);

    for (const auto& signal : signals) {
        if (ledger_->open_position_count() >= capacity) {
            break;
        }

        auto opened = ledger_->open_position(signal, date);
        if (opened.is_ok()) {
            continue;
        }

        const OptsimError& error = *opened.error();
        if (error.code() == ErrorCode::INSUFFICIENT_FUNDS) {
            DEBUG("Skipping signal: " << error.what());
            reporter_->report(BacktestErrorKind::INSUFFICIENT_CAPITAL, error,
                              {{"date", core::format_date(date)}, {"symbol", signal.symbol}});
        } else {
            WARN("Rejected signal for " << signal.symbol << " on " << core::format_date(date)
                                        << ": " << error.what());
        }
    }
}

void BacktestCoordinator::report_fetch_failures(const std::vector<FetchFailure>& failures,
                                                const Timestamp& date) {
    for (const auto& failure : failures) {
        WARN("No market data for " << failure.symbol << " on " << core::format_date(date)
                                   << ": " << failure.message);
        reporter_->report(BacktestErrorKind::DATA_UNAVAILABLE, failure.message,
                          "BacktestCoordinator",
                          {{"date", core::format_date(date)}, {"symbol", failure.symbol}},
                          failure.code);
    }
}

void BacktestCoordinator::finalize_run(RunStatus status,
                                       const std::optional<std::string>& failure_message) {
    Logger::instance().set_trading_date("");
    current_run_.status = status;
    current_run_.failure_message = failure_message;
    current_run_.trades = ledger_->closed_trades();
    current_run_.final_capital = ledger_->current_capital();
    current_run_.metrics = metrics_calculator_->calculate_all_metrics(
        current_run_.initial_capital, current_run_.final_capital, current_run_.equity_curve,
        current_run_.trades);
}

Result<BacktestRun> BacktestCoordinator::fail_run(ErrorCode code, const std::string& message,
                                                  const Timestamp& date) {
    ERROR("Backtest " << current_run_.strategy_id << " aborted on " << core::format_date(date)
                      << ": " << message);
    reporter_->report(BacktestErrorKind::ORCHESTRATION_FAILURE, message, "BacktestCoordinator",
                      {{"date", core::format_date(date)},
                       {"strategy_id", current_run_.strategy_id}},
                      code);

    // Partial results are kept for diagnostics only; final_capital is cash on hand
    finalize_run(RunStatus::FAILED, message);
    last_run_ = current_run_;

    return make_error<BacktestRun>(code, message, "BacktestCoordinator");
}

void BacktestCoordinator::persist_results(BacktestRun& run) {
    for (const auto& sink : sinks_) {
        auto persisted = sink->persist(run);
        if (persisted.is_error()) {
            ERROR("Results sink " << sink->name()
                                  << " failed to persist run: " << persisted.error()->what());
            reporter_->report(BacktestErrorKind::ORCHESTRATION_FAILURE, *persisted.error(),
                              {{"sink", sink->name()}, {"strategy_id", run.strategy_id}});
            continue;
        }

        const std::string& run_id = persisted.value();
        if (run.run_id.empty()) {
            run.run_id = run_id;
        }

        size_t failed_trades = 0;
        for (const auto& trade : run.trades) {
            auto stored = sink->persist_trade(run_id, trade);
            if (stored.is_error()) {
                ++failed_trades;
                reporter_->report(BacktestErrorKind::ORCHESTRATION_FAILURE, *stored.error(),
                                  {{"sink", sink->name()},
                                   {"run_id", run_id},
                                   {"position_id", std::to_string(trade.position_id)}});
            }
        }

        if (failed_trades > 0) {
            ERROR("Results sink " << sink->name() << " failed to store " << failed_trades << " of "
                                  << run.trades.size() << " trades for run " << run_id);
        } else {
            INFO("Persisted run " << run_id << " with " << run.trades.size() << " trades to "
                                  << sink->name());
        }
    }
}

}  // namespace backtest
}  // namespace optsim
