// include/optsim/storage/csv_results_sink.hpp
#pragma once

#include <filesystem>
#include <string>
#include "optsim/storage/results_sink.hpp"

namespace optsim {

/**
 * @brief Writes each run to <output_directory>/<run_id>/
 *
 * Files: summary.json (run fields and metrics), equity_curve.csv, and
 * trades.csv (header written by persist, one row per persist_trade).
 */
class CsvResultsSink : public ResultsSink {
public:
    explicit CsvResultsSink(std::string output_directory);

    std::string name() const override {
        return "csv";
    }

    /**
     * @brief Write summary and equity curve
     *
     * Reuses run.run_id when already assigned, otherwise generates one from
     * the strategy id and the current time.
     */
    Result<std::string> persist(const backtest::BacktestRun& run) override;

    Result<void> persist_trade(const std::string& run_id,
                               const backtest::ClosedTrade& trade) override;

    std::filesystem::path run_directory(const std::string& run_id) const;

private:
    Result<void> write_equity_curve(const std::filesystem::path& dir,
                                    const backtest::BacktestRun& run) const;

    std::string output_directory_;
};

}  // namespace optsim
