// src/core/error_reporter.cpp

#include "optsim/core/error_reporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "optsim/core/logger.hpp"
#include "optsim/core/time_utils.hpp"

namespace optsim {

std::string backtest_error_kind_to_string(BacktestErrorKind kind) {
    switch (kind) {
        case BacktestErrorKind::DATA_UNAVAILABLE:
            return "DATA_UNAVAILABLE";
        case BacktestErrorKind::INSUFFICIENT_CAPITAL:
            return "INSUFFICIENT_CAPITAL";
        case BacktestErrorKind::MISSING_MARKET_QUOTE:
            return "MISSING_MARKET_QUOTE";
        case BacktestErrorKind::ORCHESTRATION_FAILURE:
            return "ORCHESTRATION_FAILURE";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json ErrorRecord::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["kind"] = backtest_error_kind_to_string(kind);
    j["code"] = error_code_to_string(code);
    j["component"] = component;
    j["message"] = message;
    j["reported_at"] = core::format_timestamp(reported_at);
    j["context"] = context;
    return j;
}

ErrorReporter::ErrorReporter(size_t max_records) : max_records_(max_records == 0 ? 1 : max_records) {}

std::string ErrorReporter::report(BacktestErrorKind kind, const std::string& message,
                                  const std::string& component,
                                  const std::map<std::string, std::string>& context,
                                  ErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream id;
    id << backtest_error_kind_to_string(kind) << "_" << std::setfill('0') << std::setw(6)
       << next_id_++;

    ErrorRecord record;
    record.id = id.str();
    record.kind = kind;
    record.code = code;
    record.component = component;
    record.message = message;
    record.reported_at = std::chrono::system_clock::now();
    record.context = context;

    counts_[kind]++;
    records_.push_back(std::move(record));

    while (records_.size() > max_records_) {
        records_.pop_front();
    }

    return id.str();
}

std::string ErrorReporter::report(BacktestErrorKind kind, const OptsimError& error,
                                  const std::map<std::string, std::string>& context) {
    return report(kind, error.what(), error.component(), context, error.code());
}

size_t ErrorReporter::count(BacktestErrorKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(kind);
    return it == counts_.end() ? 0 : it->second;
}

size_t ErrorReporter::total_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [kind, count] : counts_) {
        total += count;
    }
    return total;
}

std::vector<ErrorRecord> ErrorReporter::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ErrorRecord>(records_.begin(), records_.end());
}

std::optional<ErrorRecord> ErrorReporter::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.id == id) {
            return record;
        }
    }
    return std::nullopt;
}

nlohmann::json ErrorReporter::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j;
    size_t total = 0;
    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [kind, count] : counts_) {
        counts[backtest_error_kind_to_string(kind)] = count;
        total += count;
    }
    j["total_errors"] = total;
    j["counts"] = counts;
    j["retained"] = records_.size();

    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : records_) {
        records.push_back(record.to_json());
    }
    j["records"] = records;
    return j;
}

Result<void> ErrorReporter::export_to_file(const std::string& filepath) const {
    std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create directory " + parent.string() + ": " +
                                        ec.message(),
                                    "ErrorReporter");
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open error export file: " + filepath, "ErrorReporter");
    }
    file << std::setw(2) << to_json() << std::endl;
    if (!file.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to write error export file: " + filepath, "ErrorReporter");
    }
    INFO("Exported " << total_count() << " error reports to " << filepath);
    return Result<void>();
}

void ErrorReporter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.clear();
    records_.clear();
}

}  // namespace optsim
