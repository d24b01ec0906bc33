// include/tsdiag/core/logger.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "tsdiag/core/config_base.hpp"

namespace tsdiag {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed numerical traces
    DEBUG,    // Per-test parameters and outcomes
    INFO,     // Aggregated verdicts
    WARNING,  // Suspicious but usable input
    ERR,      // Failed operations
    FATAL     // Unrecoverable failures
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"tsdiag"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};  // Rotate after 10MB
    size_t max_files{5};                      // Log files kept in log_directory

    nlohmann::json to_json() const override;

    /**
     * @brief Load logger settings
     * @throws DiagError on an unknown level or destination name
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging class
 */
class Logger {
public:
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

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages from the calling thread with a component name
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

    void open_log_file();
    void prune_log_files();
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::string session_timestamp_;
    int part_number_{1};
    static thread_local std::string current_component_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                        \
    do {                                                           \
        if (level >= ::tsdiag::Logger::instance().get_min_level()) { \
            std::ostringstream os;                                 \
            os << message;                                         \
            ::tsdiag::Logger::instance().log(level, os.str());     \
        }                                                          \
    } while (0)

#define TRACE(message) LOG(::tsdiag::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::tsdiag::LogLevel::DEBUG, message)
#define INFO(message) LOG(::tsdiag::LogLevel::INFO, message)
#define WARN(message) LOG(::tsdiag::LogLevel::WARNING, message)
#define ERROR(message) LOG(::tsdiag::LogLevel::ERR, message)
#define FATAL(message) LOG(::tsdiag::LogLevel::FATAL, message)
}  // namespace tsdiag
