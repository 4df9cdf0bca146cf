#include <iomanip>
#include <iostream>
#include "optsim/backtest/backtest_coordinator.hpp"
#include "optsim/core/config_base.hpp"
#include "optsim/core/logger.hpp"
#include "optsim/core/time_utils.hpp"
#include "optsim/data/database_config.hpp"
#include "optsim/data/postgres_database.hpp"
#include "optsim/data/postgres_market_data_provider.hpp"
#include "optsim/storage/csv_results_sink.hpp"
#include "optsim/storage/postgres_results_sink.hpp"
#include "optsim/strategy/liquidity_screen_strategy.hpp"

using namespace optsim;
using namespace optsim::backtest;

namespace {

/**
 * @brief Everything the runner reads from its JSON file
 */
struct RunnerConfig : public ConfigBase {
    std::string strategy_id{"LIQUIDITY_SCREEN"};
    BacktestConfig backtest;
    LiquidityScreenConfig strategy;
    DatabaseConfig database;
    LoggerConfig logging;
    bool store_to_database{true};
    std::string csv_output_directory;  // Empty disables CSV output
    std::string error_report_path;     // Empty disables the error report

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["strategy_id"] = strategy_id;
        j["backtest"] = backtest.to_json();
        j["strategy"] = strategy.to_json();
        j["database"] = database.to_json();
        j["logging"] = logging.to_json();
        j["store_to_database"] = store_to_database;
        j["csv_output_directory"] = csv_output_directory;
        j["error_report_path"] = error_report_path;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("strategy_id"))
            strategy_id = j.at("strategy_id").get<std::string>();
        if (j.contains("backtest"))
            backtest.from_json(j.at("backtest"));
        if (j.contains("strategy"))
            strategy.from_json(j.at("strategy"));
        if (j.contains("database"))
            database.from_json(j.at("database"));
        if (j.contains("logging"))
            logging.from_json(j.at("logging"));
        if (j.contains("store_to_database"))
            store_to_database = j.at("store_to_database").get<bool>();
        if (j.contains("csv_output_directory"))
            csv_output_directory = j.at("csv_output_directory").get<std::string>();
        if (j.contains("error_report_path"))
            error_report_path = j.at("error_report_path").get<std::string>();
    }

    Result<void> validate() const override {
        auto backtest_result = backtest.validate();
        if (backtest_result.is_error()) {
            return backtest_result;
        }
        auto strategy_result = strategy.validate();
        if (strategy_result.is_error()) {
            return strategy_result;
        }
        // Market data always comes from the database
        return database.validate();
    }
};

void print_summary(const BacktestRun& run, const ErrorReporter& reporter) {
    const auto& m = run.metrics;
    std::cout << "\n=== Backtest Results ===" << std::endl;
    std::cout << "Run ID:          " << (run.run_id.empty() ? "(not persisted)" : run.run_id)
              << std::endl;
    std::cout << "Final Capital:   $" << std::fixed << std::setprecision(2) << run.final_capital
              << std::endl;
    std::cout << "Total Return:    " << std::setprecision(2) << m.total_return_pct << "%"
              << std::endl;
    std::cout << "Annualized:      " << m.annualized_return_pct << "%" << std::endl;
    std::cout << "Sharpe Ratio:    " << std::setprecision(3) << m.sharpe_ratio << std::endl;
    std::cout << "Sortino Ratio:   " << m.sortino_ratio << std::endl;
    std::cout << "Max Drawdown:    " << std::setprecision(2) << m.max_drawdown_pct << "% ("
              << m.max_drawdown_duration_days << " days)" << std::endl;
    std::cout << "Total Trades:    " << m.total_trades << std::endl;
    std::cout << "Win Rate:        " << m.win_rate << "%" << std::endl;
    std::cout << "Profit Factor:   " << std::setprecision(3) << m.profit_factor << std::endl;
    std::cout << "Reported Issues: " << reporter.total_count() << std::endl;
    std::cout << "========================\n" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = argc > 1 ? argv[1] : "config/bt_options.json";

        RunnerConfig config;
        auto load_result = config.load_from_file(config_path);
        if (load_result.is_error()) {
            std::cerr << "Failed to load " << config_path << ": " << load_result.error()->what()
                      << std::endl;
            return 1;
        }

        Logger::reset_for_tests();
        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_options");
        INFO("Loaded configuration from " << config_path);
        if (!config.store_to_database && config.csv_output_directory.empty()) {
            WARN("Neither database nor CSV output is enabled; results will not be saved");
        }

        // Database connection
        auto db = std::make_shared<PostgresDatabase>(config.database.connection_string());
        auto connect_result = db->connect();
        if (connect_result.is_error()) {
            std::cerr << "Failed to connect to database: " << connect_result.error()->what()
                      << std::endl;
            return 1;
        }

        auto provider = std::make_shared<PostgresMarketDataProvider>(db);
        auto reporter = std::make_shared<ErrorReporter>();
        BacktestCoordinator coordinator(provider, {}, reporter);

        if (config.store_to_database) {
            coordinator.add_sink(std::make_shared<PostgresResultsSink>(db, config.to_json()));
        }
        if (!config.csv_output_directory.empty()) {
            coordinator.add_sink(std::make_shared<CsvResultsSink>(config.csv_output_directory));
        }

        std::cout << "\n=== Backtest Configuration ===" << std::endl;
        std::cout << "Symbols: ";
        for (const auto& symbol : config.backtest.symbols) {
            std::cout << symbol << " ";
        }
        std::cout << std::endl;
        std::cout << "Period: " << core::format_date(config.backtest.start_date) << " to "
                  << core::format_date(config.backtest.end_date) << std::endl;
        std::cout << "Initial capital: $" << std::fixed << std::setprecision(0)
                  << config.backtest.initial_capital << std::endl;
        std::cout << "Max positions: " << config.backtest.max_positions << std::endl;
        std::cout << "================================\n" << std::endl;

        auto strategy = std::make_shared<LiquidityScreenStrategy>(config.strategy_id,
                                                                  config.strategy);
        auto result = coordinator.run(config.backtest, strategy);

        if (!config.error_report_path.empty()) {
            auto export_result = reporter->export_to_file(config.error_report_path);
            if (export_result.is_error()) {
                WARN("Failed to export error report: " << export_result.error()->what());
            }
        }

        if (result.is_error()) {
            std::cerr << "Backtest failed: " << result.error()->what() << std::endl;
            if (coordinator.last_run()) {
                const auto& partial = *coordinator.last_run();
                std::cerr << "Partial run: " << partial.equity_curve.size() << " days, "
                          << partial.trades.size() << " closed trades" << std::endl;
            }
            return 1;
        }

        print_summary(result.value(), *reporter);
        INFO("Backtest completed successfully");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
