// src/storage/csv_results_sink.cpp

#include "optsim/storage/csv_results_sink.hpp"
#include <fstream>
#include <iomanip>
#include "optsim/core/logger.hpp"
#include "optsim/core/run_id_generator.hpp"
#include "optsim/core/time_utils.hpp"

namespace optsim {

namespace {

constexpr const char* TRADES_HEADER =
    "position_id,symbol,option_type,strike,expiration,entry_date,entry_price,contracts,"
    "cost_basis,exit_date,exit_price,exit_reason,profit_loss,profit_loss_pct\n";

// Quote a free-text field when it would break the row, doubling inner quotes
std::string csv_field(const std::string& text) {
    if (text.find_first_of(",\"\r\n") == std::string::npos) {
        return text;
    }
    std::string escaped = text;
    size_t pos = 0;
    while ((pos = escaped.find('"', pos)) != std::string::npos) {
        escaped.replace(pos, 1, "\"\"");
        pos += 2;
    }
    return "\"" + escaped + "\"";
}

}  // namespace

CsvResultsSink::CsvResultsSink(std::string output_directory)
    : output_directory_(std::move(output_directory)) {
    Logger::register_component("CsvResultsSink");
}

std::filesystem::path CsvResultsSink::run_directory(const std::string& run_id) const {
    return std::filesystem::path(output_directory_) / run_id;
}

Result<std::string> CsvResultsSink::persist(const backtest::BacktestRun& run) {
    std::string run_id = run.run_id.empty()
                             ? RunIdGenerator::generate_run_id(run.strategy_id,
                                                               std::chrono::system_clock::now())
                             : run.run_id;

    try {
        auto dir = run_directory(run_id);
        std::filesystem::create_directories(dir);

        std::ofstream summary(dir / "summary.json");
        if (!summary.is_open()) {
            return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                           "Failed to open summary.json for writing",
                                           "CsvResultsSink");
        }
        nlohmann::json j = run.summary_json();
        j["run_id"] = run_id;
        summary << j.dump(4) << "\n";

        auto equity_result = write_equity_curve(dir, run);
        if (equity_result.is_error()) {
            return make_error<std::string>(equity_result.error()->code(),
                                           equity_result.error()->what(), "CsvResultsSink");
        }

        std::ofstream trades(dir / "trades.csv", std::ios::trunc);
        if (!trades.is_open()) {
            return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                           "Failed to open trades.csv for writing",
                                           "CsvResultsSink");
        }
        trades << TRADES_HEADER;

        INFO("Wrote backtest run " << run_id << " to " << dir.string());
        return Result<std::string>(run_id);

    } catch (const std::exception& e) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       std::string("Error writing run files: ") + e.what(),
                                       "CsvResultsSink");
    }
}

Result<void> CsvResultsSink::write_equity_curve(const std::filesystem::path& dir,
                                                const backtest::BacktestRun& run) const {
    std::ofstream file(dir / "equity_curve.csv");
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open equity_curve.csv for writing", "CsvResultsSink");
    }

    file << "date,cash,positions_value,total_equity\n";
    file << std::fixed << std::setprecision(2);
    for (const auto& point : run.equity_curve) {
        file << core::format_date(point.date) << "," << point.cash << ","
             << point.positions_value << "," << point.total_equity << "\n";
    }
    return Result<void>();
}

Result<void> CsvResultsSink::persist_trade(const std::string& run_id,
                                           const backtest::ClosedTrade& trade) {
    auto path = run_directory(run_id) / "trades.csv";
    if (!std::filesystem::exists(path)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "trades.csv not found for run " + run_id +
                                    "; persist must be called first",
                                "CsvResultsSink");
    }

    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open trades.csv for append",
                                "CsvResultsSink");
    }

    file << trade.position_id << "," << csv_field(trade.symbol) << ","
         << option_type_to_string(trade.option_type) << "," << std::fixed << std::setprecision(2)
         << trade.strike << "," << core::format_date(trade.expiration) << ","
         << core::format_date(trade.entry_date) << "," << std::setprecision(4)
         << trade.entry_price << "," << trade.contracts << "," << std::setprecision(2)
         << trade.cost_basis << "," << core::format_date(trade.exit_date) << ","
         << std::setprecision(4) << trade.exit_price << ","
         << csv_field(trade.exit_reason) << "," << std::setprecision(2) << trade.profit_loss
         << "," << std::setprecision(4) << trade.profit_loss_pct << "\n";

    return Result<void>();
}

}  // namespace optsim
