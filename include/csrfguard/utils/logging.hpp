#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <memory>
#include <exception>

namespace csrfguard::utils {

/**
 * @brief Log severity
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Receives every message that passes the level filter
 */
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * @brief Thread-safe logger implementation
 *
 * Writes timestamped lines to the console and an optional file. Hosts that
 * own a logging pipeline install a sink to receive the raw messages.
 */
class Logger {
private:
    static std::unique_ptr<Logger> instance_;
    static std::mutex instance_mutex_;

    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex log_mutex_;
    bool console_output_ = true;
    LogSink sink_;
    std::atomic<uint64_t> total_messages_{0};

    Logger() = default;

public:
    /**
     * @brief Get singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& get_instance() {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (!instance_) {
            instance_ = std::unique_ptr<Logger>(new Logger());
        }
        return *instance_;
    }

    /**
     * @brief Set minimum log level
     * @param level Minimum level to log
     */
    void set_level(LogLevel level) {
        min_level_.store(level);
    }

    /**
     * @brief Enable/disable console output
     * @param enabled Whether to enable console output
     */
    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        console_output_ = enabled;
    }

    /**
     * @brief Set log file
     * @param filename Log file path
     */
    void set_log_file(const std::string& filename) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (file_stream_) {
            file_stream_->close();
        }
        file_stream_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    }

    /**
     * @brief Stop writing to the log file
     */
    void close_log_file() {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (file_stream_) {
            file_stream_->close();
            file_stream_.reset();
        }
    }

    /**
     * @brief Install a sink, or clear it with an empty function
     *
     * The sink runs outside the logger lock and may log again. Exceptions
     * it throws are reported on stderr and not propagated.
     *
     * @param sink Callback receiving level and unformatted message
     */
    void set_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        sink_ = std::move(sink);
    }

    /**
     * @brief Log a message
     * @param level Log level
     * @param message Message to log
     */
    void log(LogLevel level, const std::string& message) {
        if (level < min_level_.load()) {
            return;
        }

        total_messages_++;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        oss << " [" << level_to_string(level) << "] " << message;

        std::string log_line = oss.str();

        LogSink sink;
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            sink = sink_;

            if (console_output_) {
                std::cout << log_line << std::endl;
            }

            if (file_stream_ && file_stream_->is_open()) {
                *file_stream_ << log_line << std::endl;
                file_stream_->flush();
            }
        }

        if (sink) {
            try {
                sink(level, message);
            } catch (const std::exception& e) {
                std::cerr << "log sink failed: " << e.what() << std::endl;
            }
        }
    }

    /**
     * @brief Get total number of logged messages
     * @return Total message count
     */
    uint64_t get_total_messages() const {
        return total_messages_.load();
    }

    /**
     * @brief Flush all log streams
     */
    void flush() {
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::cout.flush();
        if (file_stream_) {
            file_stream_->flush();
        }
    }

private:
    std::string level_to_string(LogLevel level) const {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }
};

// Static member definitions
inline std::unique_ptr<Logger> Logger::instance_;
inline std::mutex Logger::instance_mutex_;

/**
 * @brief Convenience macros for logging
 */
#define LOG_DEBUG(message) \
    csrfguard::utils::Logger::get_instance().log(csrfguard::utils::LogLevel::DEBUG, message)

#define LOG_INFO(message) \
    csrfguard::utils::Logger::get_instance().log(csrfguard::utils::LogLevel::INFO, message)

#define LOG_WARN(message) \
    csrfguard::utils::Logger::get_instance().log(csrfguard::utils::LogLevel::WARN, message)

#define LOG_ERROR(message) \
    csrfguard::utils::Logger::get_instance().log(csrfguard::utils::LogLevel::ERROR, message)

} // namespace csrfguard::utils
