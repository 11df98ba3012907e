// include/market_ingest/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace market_ingest {

/**
 * @brief Error codes for the ingestion pipeline
 * Defines all error conditions that can cross a component boundary
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,
    NOT_FOUND = 4,

    // Store errors
    DATABASE_ERROR = 10,
    CONFLICT_ERROR = 11,

    // Fetch errors (retryable)
    FETCH_ERROR = 20,
    CONNECTION_ERROR = 21,
    TIMEOUT_ERROR = 22,
    PARSE_ERROR = 23,

    // Record errors
    VALIDATION_ERROR = 30,

    // Metrics
    COMPUTATION_SKIPPED = 40,

    // File and I/O errors
    FILE_NOT_FOUND = 50,
    FILE_IO_ERROR = 51,
    JSON_PARSE_ERROR = 52,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Whether an operation failing with this code may succeed on retry
 */
inline bool is_retryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::FETCH_ERROR:
        case ErrorCode::CONNECTION_ERROR:
        case ErrorCode::TIMEOUT_ERROR:
        case ErrorCode::PARSE_ERROR:
            return true;
        default:
            return false;
    }
}

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::CONFLICT_ERROR:
            return "CONFLICT_ERROR";
        case ErrorCode::FETCH_ERROR:
            return "FETCH_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::PARSE_ERROR:
            return "PARSE_ERROR";
        case ErrorCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ErrorCode::COMPUTATION_SKIPPED:
            return "COMPUTATION_SKIPPED";
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
 * @brief Error carried by a failed Result
 */
class PipelineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for PipelineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    PipelineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
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
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<PipelineError> error) : error_(std::move(error)) {}

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
     * @return Reference to the contained value
     * @throws PipelineError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws PipelineError if result represents an error
     */
    T take() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const PipelineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<PipelineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<PipelineError> error) : error_(std::move(error)) {}

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

    const PipelineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<PipelineError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<PipelineError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result into a result of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    return make_error<T>(failed.error()->code(), failed.error()->what(),
                         failed.error()->component());
}

}  // namespace market_ingest
