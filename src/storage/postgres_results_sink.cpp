// src/storage/postgres_results_sink.cpp

#include "optsim/storage/postgres_results_sink.hpp"
#include "optsim/core/logger.hpp"
#include "optsim/core/run_id_generator.hpp"

namespace optsim {

PostgresResultsSink::PostgresResultsSink(std::shared_ptr<PostgresDatabase> db,
                                         nlohmann::json parameters,
                                         PostgresResultsSinkConfig config)
    : db_(std::move(db)), parameters_(std::move(parameters)), config_(std::move(config)) {
    if (!db_) {
        throw std::invalid_argument("PostgresResultsSink requires a database");
    }
    Logger::register_component("PostgresResultsSink");
}

Result<std::string> PostgresResultsSink::persist(const backtest::BacktestRun& run) {
    if (!db_->is_connected()) {
        auto connect_result = db_->connect();
        if (connect_result.is_error()) {
            return make_error<std::string>(connect_result.error()->code(),
                                           connect_result.error()->what(),
                                           "PostgresResultsSink");
        }
    }

    backtest::BacktestRun stored = run;
    if (stored.run_id.empty()) {
        stored.run_id =
            RunIdGenerator::generate_run_id(run.strategy_id, std::chrono::system_clock::now());
    } else if (config_.replace_existing) {
        auto delete_result = db_->delete_backtest_run(stored.run_id, config_.schema);
        if (delete_result.is_error()) {
            WARN("Could not clear previous rows of run " << stored.run_id << ": "
                                                          << delete_result.error()->what());
        }
    }

    auto run_result = db_->store_backtest_run(stored, parameters_, table("options_runs"));
    if (run_result.is_error()) {
        return make_error<std::string>(run_result.error()->code(), run_result.error()->what(),
                                       "PostgresResultsSink");
    }

    auto curve_result = db_->store_backtest_equity_curve(stored.run_id, stored.equity_curve,
                                                         table("options_equity_curve"));
    if (curve_result.is_error()) {
        return make_error<std::string>(curve_result.error()->code(),
                                       curve_result.error()->what(), "PostgresResultsSink");
    }

    return Result<std::string>(stored.run_id);
}

Result<void> PostgresResultsSink::persist_trade(const std::string& run_id,
                                                const backtest::ClosedTrade& trade) {
    return db_->store_backtest_trades(run_id, {trade}, table("options_trades"));
}

}  // namespace optsim
