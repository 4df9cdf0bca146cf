#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "optsim/backtest/backtest_metrics_calculator.hpp"
#include "optsim/backtest/backtest_types.hpp"
#include "optsim/backtest/position_ledger.hpp"
#include "optsim/core/error.hpp"
#include "optsim/core/error_reporter.hpp"
#include "optsim/core/types.hpp"
#include "optsim/data/market_data_provider.hpp"
#include "optsim/data/snapshot_fetcher.hpp"
#include "optsim/storage/results_sink.hpp"
#include "optsim/strategy/strategy_interface.hpp"

namespace optsim {
namespace backtest {

/**
 * @brief Central orchestrator of an options backtest
 *
 * Drives the day loop over the trading calendar:
 * - SnapshotFetcher: one MarketSnapshot per trading day
 * - PositionLedger: exits, entries, marks and capital accounting
 * - BacktestMetricsCalculator: analytics of the finished run
 * - ResultsSink(s): persistence of the finished run
 *
 * Non-fatal problems (missing data, unaffordable signals, stale quotes) are
 * sent to the ErrorReporter and the loop continues. A strategy error, an
 * exception escaping a day step or a capital conservation violation aborts
 * the run; the partial run stays available through last_run().
 */
class BacktestCoordinator {
private:
    std::shared_ptr<MarketDataProvider> provider_;
    std::vector<std::shared_ptr<ResultsSink>> sinks_;
    std::shared_ptr<ErrorReporter> reporter_;

    std::unique_ptr<BacktestMetricsCalculator> metrics_calculator_;
    std::unique_ptr<PositionLedger> ledger_;

    BacktestRun current_run_;
    std::optional<BacktestRun> last_run_;

public:
    /**
     * @brief Constructor
     * @param provider Market data source
     * @param sinks Destinations of finished runs, called in order
     * @param reporter Error collaborator; a private one is created if null
     */
    BacktestCoordinator(std::shared_ptr<MarketDataProvider> provider,
                        std::vector<std::shared_ptr<ResultsSink>> sinks = {},
                        std::shared_ptr<ErrorReporter> reporter = nullptr);

    ~BacktestCoordinator();

    /**
     * @brief Run one strategy over the configured date range
     *
     * @param config Simulation parameters, validated before the loop
     * @param strategy Strategy under test
     * @return The completed run (already handed to every sink) or an error
     */
    Result<BacktestRun> run(const BacktestConfig& config,
                            std::shared_ptr<OptionsStrategy> strategy);

    /**
     * @brief Process one trading day: exits, entries, equity point
     */
    Result<void> process_day(const Timestamp& date, const MarketSnapshot& snapshot,
                             OptionsStrategy& strategy, const BacktestConfig& config);

    void add_sink(std::shared_ptr<ResultsSink> sink);

    /**
     * @brief The most recent run, completed or failed
     */
    const std::optional<BacktestRun>& last_run() const {
        return last_run_;
    }

    ErrorReporter& error_reporter() {
        return *reporter_;
    }

    const PositionLedger* ledger() const {
        return ledger_.get();
    }

    BacktestMetricsCalculator* get_metrics_calculator() {
        return metrics_calculator_.get();
    }

private:
    void report_fetch_failures(const std::vector<FetchFailure>& failures, const Timestamp& date);

    void open_new_positions(const std::vector<Signal>& signals, const Timestamp& date,
                            const BacktestConfig& config);

    void finalize_run(RunStatus status, const std::optional<std::string>& failure_message);

    Result<BacktestRun> fail_run(ErrorCode code, const std::string& message,
                                 const Timestamp& date);

    void persist_results(BacktestRun& run);
};

}  // namespace backtest
}  // namespace optsim
