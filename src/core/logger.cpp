// src/core/logger.cpp

#include "optsim/core/logger.hpp"
#include <algorithm>
#include <iostream>
#include <vector>
#include "optsim/core/time_utils.hpp"

namespace optsim {

thread_local std::string Logger::current_component_;

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.min_level_.store(logger.config_.min_level, std::memory_order_relaxed);
    logger.log_dir_.clear();
    logger.session_.clear();
    logger.part_ = 1;
    logger.trading_date_.clear();
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    min_level_.store(config.min_level, std::memory_order_relaxed);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (writes_file()) {
        log_dir_ = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir_, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir_.string() +
                                     " - " + ec.message());
        }

        session_ = core::get_formatted_time("%Y%m%d_%H%M%S", true);
        prune_log_files_unsafe();
        open_part_unsafe(1);
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file: " + part_path(1).string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::set_trading_date(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    trading_date_ = date;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }
    if (level < get_min_level()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string line = format_message(level, message);

    if (writes_console()) {
        std::cout << line << std::endl;
    }
    if (writes_file()) {
        write_to_file_unsafe(line);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S", true) << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    if (config_.include_trading_date && !trading_date_.empty()) {
        ss << "(" << trading_date_ << ") ";
    }

    ss << message;
    return ss.str();
}

std::filesystem::path Logger::part_path(int part) const {
    return log_dir_ /
           (config_.filename_prefix + "_" + session_ + "_part" + std::to_string(part) + ".log");
}

bool Logger::is_own_log_file(const std::filesystem::path& path) const {
    // Only <prefix>_*.log belongs to this logger; anything else is left alone
    std::string name = path.filename().string();
    return path.extension() == ".log" && name.rfind(config_.filename_prefix + "_", 0) == 0;
}

void Logger::open_part_unsafe(int part) {
    part_ = part;
    log_file_.open(part_path(part_), std::ios::app);
}

void Logger::write_to_file_unsafe(const std::string& line) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << line << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        log_file_.close();
        prune_log_files_unsafe();
        open_part_unsafe(part_ + 1);
    }
}

void Logger::prune_log_files_unsafe() {
    std::vector<std::filesystem::path> own_files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir_, ec)) {
        if (entry.is_regular_file() && is_own_log_file(entry.path())) {
            own_files.push_back(entry.path());
        }
    }

    std::sort(own_files.begin(), own_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the part about to be opened
    size_t excess = own_files.size() + 1 > config_.max_files
                        ? own_files.size() + 1 - config_.max_files
                        : 0;
    for (size_t i = 0; i < excess && i < own_files.size(); ++i) {
        std::filesystem::remove(own_files[i], ec);
    }
}

}  // namespace optsim
