// include/shroud/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace shroud {

/**
 * @brief Error codes for the order pipeline
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Input and layout errors
    VALIDATION_ERROR = 4,
    PARSE_ERROR = 5,
    JSON_PARSE_ERROR = 6,

    // Security and encryption errors
    ENCRYPTION_ERROR = 7,
    DECRYPTION_ERROR = 8,
    SIGNING_ERROR = 9,

    // Chain and network errors
    CONNECTION_ERROR = 10,
    TIMEOUT_ERROR = 11,
    CHAIN_READ_ERROR = 12,
    SIMULATION_ERROR = 13,
    SUBMISSION_ERROR = 14,

    // Shielded flow errors
    SETTLEMENT_GAP = 15,

    // File and I/O errors
    FILE_IO_ERROR = 16,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ErrorCode::PARSE_ERROR:
            return "PARSE_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::ENCRYPTION_ERROR:
            return "ENCRYPTION_ERROR";
        case ErrorCode::DECRYPTION_ERROR:
            return "DECRYPTION_ERROR";
        case ErrorCode::SIGNING_ERROR:
            return "SIGNING_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::CHAIN_READ_ERROR:
            return "CHAIN_READ_ERROR";
        case ErrorCode::SIMULATION_ERROR:
            return "SIMULATION_ERROR";
        case ErrorCode::SUBMISSION_ERROR:
            return "SUBMISSION_ERROR";
        case ErrorCode::SETTLEMENT_GAP:
            return "SETTLEMENT_GAP";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Error raised or carried by shroud components
 */
class ShroudError : public std::runtime_error {
public:
    /**
     * @brief Constructor for ShroudError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    ShroudError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
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
    Result(std::unique_ptr<ShroudError> error) : error_(std::move(error)) {}

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

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws ShroudError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const ShroudError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<ShroudError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<ShroudError> error) : error_(std::move(error)) {}

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

    const ShroudError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<ShroudError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<ShroudError>(code, message, component));
}

/**
 * @brief Re-wrap an error from another Result under a new value type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    return make_error<T>(failed.error()->code(), failed.error()->what(),
                         failed.error()->component());
}

}  // namespace shroud
