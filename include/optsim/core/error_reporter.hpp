// include/optsim/core/error_reporter.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "optsim/core/error.hpp"
#include "optsim/core/types.hpp"

namespace optsim {

/**
 * @brief Classification of problems raised while a backtest runs
 *
 * Everything except ORCHESTRATION_FAILURE is recoverable: the day loop
 * logs it and moves on.
 */
enum class BacktestErrorKind {
    DATA_UNAVAILABLE,
    INSUFFICIENT_CAPITAL,
    MISSING_MARKET_QUOTE,
    ORCHESTRATION_FAILURE
};

std::string backtest_error_kind_to_string(BacktestErrorKind kind);

/**
 * @brief One reported problem
 */
struct ErrorRecord {
    std::string id;
    BacktestErrorKind kind{BacktestErrorKind::ORCHESTRATION_FAILURE};
    ErrorCode code{ErrorCode::UNKNOWN_ERROR};
    std::string component;
    std::string message;
    Timestamp reported_at;
    std::map<std::string, std::string> context;

    nlohmann::json to_json() const;
};

/**
 * @brief Collects recoverable and fatal errors for a backtest
 *
 * Owned by the caller and handed to the coordinator. Counts are kept for
 * every report; only the newest max_records records are retained.
 */
class ErrorReporter {
public:
    explicit ErrorReporter(size_t max_records = 1000);

    /**
     * @brief Record a problem
     * @return Unique id of the new record
     */
    std::string report(BacktestErrorKind kind, const std::string& message,
                       const std::string& component,
                       const std::map<std::string, std::string>& context = {},
                       ErrorCode code = ErrorCode::UNKNOWN_ERROR);

    /**
     * @brief Record a problem carried by a failed Result
     */
    std::string report(BacktestErrorKind kind, const OptsimError& error,
                       const std::map<std::string, std::string>& context = {});

    size_t count(BacktestErrorKind kind) const;
    size_t total_count() const;

    std::vector<ErrorRecord> records() const;
    std::optional<ErrorRecord> find(const std::string& id) const;

    /**
     * @brief Counts per kind plus the retained records
     */
    nlohmann::json to_json() const;

    /**
     * @brief Write to_json() to a file
     */
    Result<void> export_to_file(const std::string& filepath) const;

    void clear();

    size_t max_records() const {
        return max_records_;
    }

private:
    mutable std::mutex mutex_;
    size_t max_records_;
    uint64_t next_id_{1};
    std::map<BacktestErrorKind, size_t> counts_;
    std::deque<ErrorRecord> records_;
};

}  // namespace optsim
