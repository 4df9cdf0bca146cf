// include/optsim/storage/postgres_results_sink.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "optsim/data/postgres_database.hpp"
#include "optsim/storage/results_sink.hpp"

namespace optsim {

struct PostgresResultsSinkConfig {
    std::string schema = "backtest";
    bool replace_existing = true;  // Delete rows of a re-used run id first
};

/**
 * @brief Stores runs in <schema>.options_runs, options_trades and
 * options_equity_curve
 */
class PostgresResultsSink : public ResultsSink {
public:
    /**
     * @param db Connected database, shared with other components
     * @param parameters Run parameters stored alongside the summary
     */
    PostgresResultsSink(std::shared_ptr<PostgresDatabase> db, nlohmann::json parameters = {},
                        PostgresResultsSinkConfig config = {});

    std::string name() const override {
        return "postgres";
    }

    Result<std::string> persist(const backtest::BacktestRun& run) override;

    Result<void> persist_trade(const std::string& run_id,
                               const backtest::ClosedTrade& trade) override;

private:
    std::string table(const std::string& name) const {
        return config_.schema + "." + name;
    }

    std::shared_ptr<PostgresDatabase> db_;
    nlohmann::json parameters_;
    PostgresResultsSinkConfig config_;
};

}  // namespace optsim
