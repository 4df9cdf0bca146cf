// include/optsim/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace optsim {

/**
 * @brief Error codes shared by every optsim component
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATABASE_ERROR = 4,
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Ledger errors
    INSUFFICIENT_FUNDS = 8,
    POSITION_NOT_FOUND = 9,
    INVALID_SIGNAL = 10,
    CAPITAL_INVARIANT_VIOLATION = 11,

    // Strategy errors
    STRATEGY_ERROR = 12,

    // System errors
    CONNECTION_ERROR = 13,
    TIMEOUT_ERROR = 14,
    MARKET_DATA_ERROR = 15,
    ORCHESTRATION_ERROR = 16,

    // File and I/O errors
    FILE_NOT_FOUND = 17,
    FILE_IO_ERROR = 18,
    JSON_PARSE_ERROR = 19
};

/**
 * @brief Human readable name of an error code
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::POSITION_NOT_FOUND:
            return "POSITION_NOT_FOUND";
        case ErrorCode::INVALID_SIGNAL:
            return "INVALID_SIGNAL";
        case ErrorCode::CAPITAL_INVARIANT_VIOLATION:
            return "CAPITAL_INVARIANT_VIOLATION";
        case ErrorCode::STRATEGY_ERROR:
            return "STRATEGY_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::MARKET_DATA_ERROR:
            return "MARKET_DATA_ERROR";
        case ErrorCode::ORCHESTRATION_ERROR:
            return "ORCHESTRATION_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Exception type carried by failed results
 */
class OptsimError : public std::runtime_error {
public:
    /**
     * @brief Constructor
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where the error occurred
     */
    OptsimError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Format as "Error in <component>: <message> (Code: <name>)"
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " +
               error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Success constructor
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Error constructor
     */
    Result(std::unique_ptr<OptsimError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @throws OptsimError if the result holds an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out
     * @throws OptsimError if the result holds an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const OptsimError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<OptsimError> error_;
};

template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<OptsimError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const OptsimError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<OptsimError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where the error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<OptsimError>(code, message, component));
}

}  // namespace optsim
