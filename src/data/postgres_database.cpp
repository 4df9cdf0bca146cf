// src/data/postgres_database.cpp

#include "optsim/data/postgres_database.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include "optsim/core/time_utils.hpp"

namespace optsim {

namespace {

using TableResult = Result<std::shared_ptr<arrow::Table>>;

TableResult builder_error(const std::string& operation) {
    return make_error<std::shared_ptr<arrow::Table>>(
        ErrorCode::CONVERSION_ERROR, "Arrow builder error during " + operation, "PostgresDatabase");
}

int64_t to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

arrow::Status append_nullable(arrow::DoubleBuilder& builder, const pqxx::field& field) {
    if (field.is_null()) {
        return builder.AppendNull();
    }
    return builder.Append(field.as<double>());
}

std::shared_ptr<arrow::Schema> chain_schema() {
    return arrow::schema({arrow::field("symbol", arrow::utf8()),
                          arrow::field("option_type", arrow::utf8()),
                          arrow::field("strike", arrow::float64()),
                          arrow::field("expiration", arrow::timestamp(arrow::TimeUnit::SECOND)),
                          arrow::field("bid", arrow::float64()),
                          arrow::field("ask", arrow::float64()),
                          arrow::field("last", arrow::float64()),
                          arrow::field("volume", arrow::int64()),
                          arrow::field("open_interest", arrow::int64()),
                          arrow::field("underlying_price", arrow::float64()),
                          arrow::field("implied_volatility", arrow::float64()),
                          arrow::field("delta", arrow::float64()),
                          arrow::field("gamma", arrow::float64()),
                          arrow::field("theta", arrow::float64()),
                          arrow::field("vega", arrow::float64())});
}

}  // namespace

PostgresDatabase::PostgresDatabase(std::string connection_string)
    : connection_string_(std::move(connection_string)), connection_(nullptr) {
    Logger::register_component("PostgresDatabase");
}

PostgresDatabase::~PostgresDatabase() {
    disconnect();
}

Result<void> PostgresDatabase::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresDatabase");
        }
        INFO("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

void PostgresDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresDatabase::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresDatabase::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresDatabase");
    }
    return Result<void>();
}

std::string PostgresDatabase::format_timestamp(const Timestamp& ts) const {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::stringstream ss;
    std::tm time_info;
    core::safe_gmtime(&time_t, &time_info);
    ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// ============================================================================
// MARKET DATA
// ============================================================================

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::get_option_chain(
    const std::string& symbol, const Timestamp& date, const std::string& table_name) {
    auto symbol_validation = validate_symbol(symbol);
    if (symbol_validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(symbol_validation.error()->code(),
                                                         symbol_validation.error()->what(),
                                                         "PostgresDatabase");
    }
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(table_validation.error()->code(),
                                                         table_validation.error()->what(),
                                                         "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(validation.error()->code(),
                                                         validation.error()->what(),
                                                         "PostgresDatabase");
    }

    try {
        std::string query =
            "SELECT symbol, option_type, strike, expiration::text AS expiration, bid, ask, last, "
            "volume, open_interest, underlying_price, implied_volatility, delta, gamma, theta, "
            "vega FROM " +
            table_name + " WHERE symbol = $1 AND quote_date = $2 "
            "ORDER BY expiration, strike, option_type";

        pqxx::work txn(*connection_);
        auto result = txn.exec_params(query, symbol, core::format_date(date));
        txn.commit();

        return convert_chain_to_arrow(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR,
            "Failed to fetch option chain for " + symbol + ": " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::get_underlying_history(
    const std::string& symbol, const Timestamp& start_date, const Timestamp& end_date,
    const std::string& table_name) {
    if (start_date > end_date) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_ARGUMENT, "Start date must be before end date", "PostgresDatabase");
    }
    auto symbol_validation = validate_symbol(symbol);
    if (symbol_validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(symbol_validation.error()->code(),
                                                         symbol_validation.error()->what(),
                                                         "PostgresDatabase");
    }
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(table_validation.error()->code(),
                                                         table_validation.error()->what(),
                                                         "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(validation.error()->code(),
                                                         validation.error()->what(),
                                                         "PostgresDatabase");
    }

    try {
        std::string query = "SELECT time::date::text AS time, close FROM " + table_name +
                            " WHERE symbol = $1 AND time::date BETWEEN $2 AND $3 ORDER BY time";

        pqxx::work txn(*connection_);
        auto result = txn.exec_params(query, symbol, core::format_date(start_date),
                                      core::format_date(end_date));
        txn.commit();

        return convert_history_to_arrow(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR,
            "Failed to fetch underlying history for " + symbol + ": " + std::string(e.what()),
            "PostgresDatabase");
    }
}

// ============================================================================
// BACKTEST DATA STORAGE METHODS
// ============================================================================

Result<void> PostgresDatabase::store_backtest_run(const backtest::BacktestRun& run,
                                                  const nlohmann::json& parameters,
                                                  const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return table_validation;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        nlohmann::json symbols = run.symbols;
        std::string query =
            "INSERT INTO " + table_name +
            " (run_id, strategy_id, symbols, start_date, end_date, initial_capital, "
            "final_capital, status, failure_message, parameters, metrics, created_at) "
            "VALUES ($1, $2, $3::jsonb, $4, $5, $6, $7, $8, $9, $10::jsonb, $11::jsonb, NOW())";

        pqxx::work txn(*connection_);
        txn.exec_params(query, run.run_id, run.strategy_id, symbols.dump(),
                        core::format_date(run.start_date), core::format_date(run.end_date),
                        run.initial_capital, run.final_capital,
                        backtest::run_status_to_string(run.status), run.failure_message,
                        parameters.dump(), run.metrics.to_json().dump());
        txn.commit();

        INFO("Stored backtest run " << run.run_id << " in " << table_name);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store backtest run: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::store_backtest_trades(
    const std::string& run_id, const std::vector<backtest::ClosedTrade>& trades,
    const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return table_validation;
    }
    if (trades.empty()) {
        return Result<void>();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        std::string query =
            "INSERT INTO " + table_name +
            " (run_id, position_id, symbol, option_type, strike, expiration, entry_date, "
            "entry_price, contracts, cost_basis, exit_date, exit_price, exit_reason, "
            "profit_loss, profit_loss_pct) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15)";

        pqxx::work txn(*connection_);
        for (const auto& trade : trades) {
            txn.exec_params(query, run_id, static_cast<int64_t>(trade.position_id), trade.symbol,
                            option_type_to_string(trade.option_type), trade.strike,
                            core::format_date(trade.expiration), core::format_date(trade.entry_date),
                            trade.entry_price, trade.contracts, trade.cost_basis,
                            core::format_date(trade.exit_date), trade.exit_price, trade.exit_reason,
                            trade.profit_loss, trade.profit_loss_pct);
        }
        txn.commit();

        INFO("Stored " << trades.size() << " backtest trades for run " << run_id);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store backtest trades: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::store_backtest_equity_curve(
    const std::string& run_id, const std::vector<backtest::EquityPoint>& equity_curve,
    const std::string& table_name) {
    auto table_validation = validate_table_name(table_name);
    if (table_validation.is_error()) {
        return table_validation;
    }
    if (equity_curve.empty()) {
        return Result<void>();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);

        // One multi-row insert; equity curves span every trading day of the run
        std::vector<std::string> value_strings;
        value_strings.reserve(equity_curve.size());
        for (const auto& point : equity_curve) {
            std::ostringstream values;
            values << std::setprecision(15) << "(" << txn.quote(run_id) << ", "
                   << txn.quote(core::format_date(point.date)) << ", " << point.cash << ", "
                   << point.positions_value << ", " << point.total_equity << ")";
            value_strings.push_back(values.str());
        }

        std::string query = "INSERT INTO " + table_name +
                            " (run_id, date, cash, positions_value, total_equity) VALUES " +
                            pqxx::separated_list(",", value_strings.begin(), value_strings.end());
        txn.exec(query);
        txn.commit();

        DEBUG("Stored " << equity_curve.size() << " equity points for run " << run_id);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to store equity curve: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::delete_backtest_run(const std::string& run_id,
                                                   const std::string& schema) {
    auto schema_validation = validate_table_name(schema);
    if (schema_validation.is_error()) {
        return schema_validation;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec_params("DELETE FROM " + schema + ".options_trades WHERE run_id = $1", run_id);
        txn.exec_params("DELETE FROM " + schema + ".options_equity_curve WHERE run_id = $1",
                        run_id);
        txn.exec_params("DELETE FROM " + schema + ".options_runs WHERE run_id = $1", run_id);
        txn.commit();
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to delete backtest run: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

Result<void> PostgresDatabase::validate_table_name(const std::string& table_name) const {
    if (table_name.empty() || table_name.size() > 100) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid table_name: must be 1-100 characters", "PostgresDatabase");
    }

    // schema.table format only
    for (char c : table_name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains invalid characters",
                                    "PostgresDatabase");
        }
    }

    std::string lower_name = table_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::vector<std::string> forbidden = {
        "drop", "delete", "insert", "update", "alter", "create", "union", "select"};

    for (const auto& forbidden_word : forbidden) {
        if (lower_name.find(forbidden_word) != std::string::npos) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains forbidden SQL keywords",
                                    "PostgresDatabase");
        }
    }

    return Result<void>();
}

Result<void> PostgresDatabase::validate_symbol(const std::string& symbol) const {
    if (symbol.empty() || symbol.size() > 20) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid symbol: must be 1-20 characters", "PostgresDatabase");
    }

    for (char c : symbol) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid symbol: contains invalid characters",
                                    "PostgresDatabase");
        }
    }

    return Result<void>();
}

// ============================================================================
// ARROW CONVERSION
// ============================================================================

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::convert_chain_to_arrow(
    const pqxx::result& result) const {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    arrow::StringBuilder symbol_builder(pool);
    arrow::StringBuilder type_builder(pool);
    arrow::DoubleBuilder strike_builder(pool);
    arrow::TimestampBuilder expiration_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
    arrow::DoubleBuilder bid_builder(pool);
    arrow::DoubleBuilder ask_builder(pool);
    arrow::DoubleBuilder last_builder(pool);
    arrow::Int64Builder volume_builder(pool);
    arrow::Int64Builder oi_builder(pool);
    arrow::DoubleBuilder underlying_builder(pool);
    arrow::DoubleBuilder iv_builder(pool);
    arrow::DoubleBuilder delta_builder(pool);
    arrow::DoubleBuilder gamma_builder(pool);
    arrow::DoubleBuilder theta_builder(pool);
    arrow::DoubleBuilder vega_builder(pool);

    try {
        for (const auto& row : result) {
            auto expiration = core::parse_date(row["expiration"].as<std::string>());
            if (expiration.is_error()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, expiration.error()->what(), "PostgresDatabase");
            }

            if (symbol_builder.Append(row["symbol"].as<std::string>()) != arrow::Status::OK() ||
                type_builder.Append(row["option_type"].as<std::string>()) != arrow::Status::OK() ||
                strike_builder.Append(row["strike"].as<double>()) != arrow::Status::OK() ||
                expiration_builder.Append(to_epoch_seconds(expiration.value())) !=
                    arrow::Status::OK() ||
                bid_builder.Append(row["bid"].as<double>(0.0)) != arrow::Status::OK() ||
                ask_builder.Append(row["ask"].as<double>(0.0)) != arrow::Status::OK() ||
                last_builder.Append(row["last"].as<double>(0.0)) != arrow::Status::OK() ||
                volume_builder.Append(row["volume"].as<int64_t>(0)) != arrow::Status::OK() ||
                oi_builder.Append(row["open_interest"].as<int64_t>(0)) != arrow::Status::OK() ||
                underlying_builder.Append(row["underlying_price"].as<double>(0.0)) !=
                    arrow::Status::OK() ||
                append_nullable(iv_builder, row["implied_volatility"]) != arrow::Status::OK() ||
                append_nullable(delta_builder, row["delta"]) != arrow::Status::OK() ||
                append_nullable(gamma_builder, row["gamma"]) != arrow::Status::OK() ||
                append_nullable(theta_builder, row["theta"]) != arrow::Status::OK() ||
                append_nullable(vega_builder, row["vega"]) != arrow::Status::OK()) {
                return builder_error("append");
            }
        }

        std::vector<std::shared_ptr<arrow::Array>> arrays(15);
        if (symbol_builder.Finish(&arrays[0]) != arrow::Status::OK() ||
            type_builder.Finish(&arrays[1]) != arrow::Status::OK() ||
            strike_builder.Finish(&arrays[2]) != arrow::Status::OK() ||
            expiration_builder.Finish(&arrays[3]) != arrow::Status::OK() ||
            bid_builder.Finish(&arrays[4]) != arrow::Status::OK() ||
            ask_builder.Finish(&arrays[5]) != arrow::Status::OK() ||
            last_builder.Finish(&arrays[6]) != arrow::Status::OK() ||
            volume_builder.Finish(&arrays[7]) != arrow::Status::OK() ||
            oi_builder.Finish(&arrays[8]) != arrow::Status::OK() ||
            underlying_builder.Finish(&arrays[9]) != arrow::Status::OK() ||
            iv_builder.Finish(&arrays[10]) != arrow::Status::OK() ||
            delta_builder.Finish(&arrays[11]) != arrow::Status::OK() ||
            gamma_builder.Finish(&arrays[12]) != arrow::Status::OK() ||
            theta_builder.Finish(&arrays[13]) != arrow::Status::OK() ||
            vega_builder.Finish(&arrays[14]) != arrow::Status::OK()) {
            return builder_error("finish");
        }

        return Result<std::shared_ptr<arrow::Table>>(arrow::Table::Make(chain_schema(), arrays));

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during option chain conversion: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::convert_history_to_arrow(
    const pqxx::result& result) const {
    arrow::MemoryPool* pool = arrow::default_memory_pool();
    arrow::TimestampBuilder time_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
    arrow::DoubleBuilder close_builder(pool);

    try {
        if (time_builder.Reserve(result.size()) != arrow::Status::OK() ||
            close_builder.Reserve(result.size()) != arrow::Status::OK()) {
            return builder_error("reserve");
        }

        for (const auto& row : result) {
            auto date = core::parse_date(row["time"].as<std::string>());
            if (date.is_error()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, date.error()->what(), "PostgresDatabase");
            }
            if (time_builder.Append(to_epoch_seconds(date.value())) != arrow::Status::OK() ||
                close_builder.Append(row["close"].as<double>()) != arrow::Status::OK()) {
                return builder_error("append");
            }
        }

        std::shared_ptr<arrow::Array> time_array, close_array;
        if (time_builder.Finish(&time_array) != arrow::Status::OK() ||
            close_builder.Finish(&close_array) != arrow::Status::OK()) {
            return builder_error("finish");
        }

        auto schema =
            arrow::schema({arrow::field("time", arrow::timestamp(arrow::TimeUnit::SECOND)),
                           arrow::field("close", arrow::float64())});
        return Result<std::shared_ptr<arrow::Table>>(
            arrow::Table::Make(schema, {time_array, close_array}));

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during history conversion: " + std::string(e.what()), "PostgresDatabase");
    }
}

}  // namespace optsim
