// src/core/logger.cpp

#include "tsdiag/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <vector>
#include "tsdiag/core/time_utils.hpp"

namespace tsdiag {

thread_local std::string Logger::current_component_;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        const std::string name = j.at("min_level").get<std::string>();
        const LogLevel levels[] = {LogLevel::TRACE,   LogLevel::DEBUG, LogLevel::INFO,
                                   LogLevel::WARNING, LogLevel::ERR,   LogLevel::FATAL};
        auto it = std::find_if(std::begin(levels), std::end(levels),
                               [&name](LogLevel l) { return level_to_string(l) == name; });
        if (it == std::end(levels)) {
            throw DiagError(ErrorCode::INVALID_ARGUMENT, "Unknown log level: " + name,
                            "LoggerConfig");
        }
        min_level = *it;
    }
    if (j.contains("destination")) {
        const std::string name = j.at("destination").get<std::string>();
        if (name == "CONSOLE")
            destination = LogDestination::CONSOLE;
        else if (name == "FILE")
            destination = LogDestination::FILE;
        else if (name == "BOTH")
            destination = LogDestination::BOTH;
        else
            throw DiagError(ErrorCode::INVALID_ARGUMENT, "Unknown log destination: " + name,
                            "LoggerConfig");
    }
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    config_ = config;
    min_level_.store(config_.min_level, std::memory_order_release);

    if (config_.destination != LogDestination::CONSOLE) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        session_timestamp_ = core::format_local_now("%Y%m%d_%H%M%S");
        part_number_ = 1;
        prune_log_files();
        open_log_file();
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.min_level_.store(logger.config_.min_level, std::memory_order_release);
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string formatted = format_message(level, message);

    if (config_.destination != LogDestination::FILE) {
        std::cout << formatted << std::endl;
    }
    if (config_.destination != LogDestination::CONSOLE) {
        write_to_file_unsafe(formatted);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        ss << core::format_local_now("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::open_log_file() {
    std::filesystem::path log_path =
        std::filesystem::absolute(config_.log_directory) /
        (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
         std::to_string(part_number_) + ".log");
    log_file_.open(log_path, std::ios::app);
}

void Logger::prune_log_files() {
    // Keep at most max_files - 1 so the file about to be opened stays within the limit
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".log") {
            log_files.push_back(entry.path());
        }
    }
    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    size_t keep = config_.max_files > 0 ? config_.max_files - 1 : 0;
    std::error_code ec;
    for (size_t i = 0; i + keep < log_files.size(); ++i) {
        std::filesystem::remove(log_files[i], ec);
        if (ec) {
            std::cerr << "WARNING: Failed to remove old log file " << log_files[i] << ": "
                      << ec.message() << std::endl;
        }
    }
}

void Logger::write_to_file_unsafe(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << message << std::endl;
    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::rotate_log_files() {
    log_file_.close();
    ++part_number_;
    prune_log_files();
    open_log_file();
}

}  // namespace tsdiag
