// include/optsim/storage/results_sink.hpp
#pragma once

#include <string>
#include "optsim/backtest/backtest_types.hpp"
#include "optsim/core/error.hpp"

namespace optsim {

/**
 * @brief Destination for finished backtest runs
 *
 * The coordinator calls persist() once per run, then persist_trade() for
 * every closed trade using the returned run id.
 */
class ResultsSink {
public:
    virtual ~ResultsSink() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Store the run summary, metrics and equity curve
     * @return The run id assigned by the sink
     */
    virtual Result<std::string> persist(const backtest::BacktestRun& run) = 0;

    virtual Result<void> persist_trade(const std::string& run_id,
                                       const backtest::ClosedTrade& trade) = 0;
};

}  // namespace optsim
