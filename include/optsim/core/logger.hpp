// include/optsim/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "optsim/core/config_base.hpp"

namespace optsim {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Recoverable conditions, the run continues
    ERR,      // Failures of a single operation
    FATAL     // Failures that abort a run
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

namespace detail {

constexpr const char* kLevelNames[] = {"TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "FATAL"};
constexpr const char* kDestinationNames[] = {"CONSOLE", "FILE", "BOTH"};

}  // namespace detail

inline std::string level_to_string(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < std::size(detail::kLevelNames) ? detail::kLevelNames[index] : "UNKNOWN";
}

inline std::string log_destination_to_string(LogDestination dest) {
    auto index = static_cast<size_t>(dest);
    return index < std::size(detail::kDestinationNames) ? detail::kDestinationNames[index]
                                                        : "UNKNOWN";
}

/**
 * @brief Parse a level name, falling back to the given default
 */
inline LogLevel level_from_string(const std::string& name, LogLevel fallback) {
    for (size_t i = 0; i < std::size(detail::kLevelNames); ++i) {
        if (name == detail::kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return fallback;
}

inline LogDestination destination_from_string(const std::string& name, LogDestination fallback) {
    for (size_t i = 0; i < std::size(detail::kDestinationNames); ++i) {
        if (name == detail::kDestinationNames[i]) {
            return static_cast<LogDestination>(i);
        }
    }
    return fallback;
}

/**
 * @brief Configuration for the logger
 *
 * JSON layout:
 *   { "min_level": "INFO", "destination": "BOTH",
 *     "file":   { "directory", "prefix", "max_file_size", "max_files" },
 *     "format": { "timestamp", "level", "trading_date" } }
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"optsim"};
    bool include_timestamp{true};
    bool include_level{true};
    bool include_trading_date{true};  // Simulated day set by the backtest loop
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    nlohmann::json to_json() const override {
        return {{"min_level", level_to_string(min_level)},
                {"destination", log_destination_to_string(destination)},
                {"file",
                 {{"directory", log_directory},
                  {"prefix", filename_prefix},
                  {"max_file_size", max_file_size},
                  {"max_files", max_files}}},
                {"format",
                 {{"timestamp", include_timestamp},
                  {"level", include_level},
                  {"trading_date", include_trading_date}}}};
    }

    void from_json(const nlohmann::json& j) override {
        min_level = level_from_string(j.value("min_level", level_to_string(min_level)), min_level);
        destination = destination_from_string(
            j.value("destination", log_destination_to_string(destination)), destination);

        if (j.contains("file")) {
            const auto& file = j.at("file");
            log_directory = file.value("directory", log_directory);
            filename_prefix = file.value("prefix", filename_prefix);
            max_file_size = file.value("max_file_size", max_file_size);
            max_files = file.value("max_files", max_files);
        }
        if (j.contains("format")) {
            const auto& format = j.at("format");
            include_timestamp = format.value("timestamp", include_timestamp);
            include_level = format.value("level", include_level);
            include_trading_date = format.value("trading_date", include_trading_date);
        }
    }
};

/**
 * @brief Thread-safe logging singleton
 *
 * Lines look like
 *   2024-06-01 09:30:00 [INFO] [PositionLedger] (2024-01-02) Opened position 7
 * where the parenthesised date is the simulated trading day, present only
 * while a backtest loop has set one. File output goes to
 * <log_directory>/<prefix>_<session>_part<N>.log and rolls over to a new
 * part once max_file_size is reached.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Stamp subsequent messages with a simulated trading day
     * @param date YYYY-MM-DD, or empty to stop stamping
     */
    void set_trading_date(const std::string& date);

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    bool writes_console() const {
        return config_.destination != LogDestination::FILE;
    }

    bool writes_file() const {
        return config_.destination != LogDestination::CONSOLE;
    }

    std::filesystem::path part_path(int part) const;
    bool is_own_log_file(const std::filesystem::path& path) const;
    void open_part_unsafe(int part);
    void prune_log_files_unsafe();
    void write_to_file_unsafe(const std::string& line);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::filesystem::path log_dir_;
    std::string session_;  // YYYYMMDD_HHMMSS of initialize()
    int part_{1};
    std::string trading_date_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                \
    do {                                                                   \
        if (level >= ::optsim::Logger::instance().get_min_level()) {       \
            std::ostringstream os;                                         \
            os << message;                                                 \
            ::optsim::Logger::instance().log(level, os.str());             \
        }                                                                  \
    } while (0)

#define TRACE(message) LOG(::optsim::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::optsim::LogLevel::DEBUG, message)
#define INFO(message) LOG(::optsim::LogLevel::INFO, message)
#define WARN(message) LOG(::optsim::LogLevel::WARNING, message)
#define ERROR(message) LOG(::optsim::LogLevel::ERR, message)
#define FATAL(message) LOG(::optsim::LogLevel::FATAL, message)
}  // namespace optsim
