// include/optsim/data/postgres_database.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "optsim/backtest/backtest_types.hpp"
#include "optsim/core/error.hpp"
#include "optsim/core/logger.hpp"
#include "optsim/core/types.hpp"

namespace optsim {

/**
 * @brief PostgreSQL access for option market data and backtest results
 *
 * Queries return Arrow tables; all calls are serialized on one connection.
 */
class PostgresDatabase {
public:
    /**
     * @brief Constructor
     * @param connection_string libpq connection string
     */
    explicit PostgresDatabase(std::string connection_string);

    ~PostgresDatabase();

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;
    PostgresDatabase(PostgresDatabase&&) = delete;
    PostgresDatabase& operator=(PostgresDatabase&&) = delete;

    Result<void> connect();

    void disconnect();

    bool is_connected() const;

    // ============================================================================
    // MARKET DATA
    // ============================================================================

    /**
     * @brief Option chain of one symbol on one quote date
     *
     * Columns: symbol, option_type, strike, expiration (timestamp[s]), bid,
     * ask, last, volume, open_interest, underlying_price, implied_volatility,
     * delta, gamma, theta, vega (greeks nullable).
     */
    Result<std::shared_ptr<arrow::Table>> get_option_chain(
        const std::string& symbol, const Timestamp& date,
        const std::string& table_name = "market_data.option_chains");

    /**
     * @brief Daily underlying closes, columns: time (timestamp[s]), close
     */
    Result<std::shared_ptr<arrow::Table>> get_underlying_history(
        const std::string& symbol, const Timestamp& start_date, const Timestamp& end_date,
        const std::string& table_name = "market_data.underlying_daily");

    // ============================================================================
    // BACKTEST DATA STORAGE METHODS
    // ============================================================================

    /**
     * @brief Store run summary, parameters and flattened metrics
     */
    Result<void> store_backtest_run(const backtest::BacktestRun& run,
                                    const nlohmann::json& parameters,
                                    const std::string& table_name = "backtest.options_runs");

    Result<void> store_backtest_trades(const std::string& run_id,
                                       const std::vector<backtest::ClosedTrade>& trades,
                                       const std::string& table_name = "backtest.options_trades");

    Result<void> store_backtest_equity_curve(
        const std::string& run_id, const std::vector<backtest::EquityPoint>& equity_curve,
        const std::string& table_name = "backtest.options_equity_curve");

    /**
     * @brief Remove a run and its dependent rows (used before re-persisting)
     */
    Result<void> delete_backtest_run(const std::string& run_id,
                                     const std::string& schema = "backtest");

    // ============================================================================
    // VALIDATION
    // ============================================================================

    Result<void> validate_table_name(const std::string& table_name) const;
    Result<void> validate_symbol(const std::string& symbol) const;

private:
    Result<void> validate_connection() const;
    std::string format_timestamp(const Timestamp& ts) const;

    Result<std::shared_ptr<arrow::Table>> convert_chain_to_arrow(const pqxx::result& result) const;
    Result<std::shared_ptr<arrow::Table>> convert_history_to_arrow(
        const pqxx::result& result) const;

    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace optsim
