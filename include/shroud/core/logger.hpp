// include/shroud/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "shroud/core/config_base.hpp"

namespace shroud {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect operation but don't stop system
    FATAL     // Critical errors that require system shutdown
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Parse a level name ("TRACE" ... "FATAL")
 * @return false if the name is unknown, leaving level untouched
 */
bool level_from_string(const std::string& name, LogLevel& level);

/**
 * @brief Parse a destination name ("CONSOLE", "FILE", "BOTH")
 * @return false if the name is unknown, leaving dest untouched
 */
bool log_destination_from_string(const std::string& name, LogDestination& dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"shroud"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging class
 */
class Logger {
public:
    /**
     * @brief Get the singleton instance
     * @return Reference to the logger instance
     */
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     * @param level Log level
     * @param message Message to log
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag all messages logged from the calling thread
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_session_file();
    void enforce_retention(const std::filesystem::path& log_dir);
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Sets the thread's component tag for the lifetime of the guard
 */
class ScopedLogComponent {
public:
    explicit ScopedLogComponent(const std::string& component)
        : previous_(Logger::current_component()) {
        Logger::register_component(component);
    }

    ~ScopedLogComponent() {
        Logger::register_component(previous_);
    }

    ScopedLogComponent(const ScopedLogComponent&) = delete;
    ScopedLogComponent& operator=(const ScopedLogComponent&) = delete;

private:
    std::string previous_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                              \
    do {                                                                 \
        if (level >= ::shroud::Logger::instance().get_min_level()) {     \
            std::ostringstream os;                                       \
            os << message;                                               \
            ::shroud::Logger::instance().log(level, os.str());           \
        }                                                                \
    } while (0)

#define TRACE(message) LOG(::shroud::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::shroud::LogLevel::DEBUG, message)
#define INFO(message) LOG(::shroud::LogLevel::INFO, message)
#define WARN(message) LOG(::shroud::LogLevel::WARNING, message)
#define ERROR(message) LOG(::shroud::LogLevel::ERR, message)
#define FATAL(message) LOG(::shroud::LogLevel::FATAL, message)
}  // namespace shroud
