/**
 * @file logging.hpp
 * @brief rfpindex Logging System
 *
 * Leveled, component-tagged logging shared by the index engine, the
 * embedding providers and the integration layer. Output goes to stderr or,
 * once a log file is configured, is appended to that file.
 */

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace rfpindex {

/**
 * Log levels, ordered from most verbose (DEBUG) to silent (OFF).
 */
enum class LogLevel {
    DEBUG = 0,   // Detailed debugging information
    INFO = 1,    // General informational messages
    WARN = 2,    // Recoverable problems (fallbacks, skipped records)
    ERROR = 3,   // Failed operations
    OFF = 4      // Disable all logging
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

/**
 * Parse a level name (either case). Unknown names map to INFO.
 */
inline LogLevel string_to_log_level(const std::string& str) {
    std::string upper;
    upper.reserve(str.size());
    for (char c : str) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "OFF" || upper == "NONE") return LogLevel::OFF;
    return LogLevel::INFO;
}

/**
 * Process-wide logger.
 *
 * Formatting happens outside the sink mutex; only the final write is
 * serialized.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) {
        current_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel get_level() const {
        return current_level_.load(std::memory_order_relaxed);
    }

    bool is_enabled(LogLevel level) const {
        return level != LogLevel::OFF && level >= current_level_.load(std::memory_order_relaxed);
    }

    void set_show_timestamp(bool show) {
        show_timestamp_.store(show, std::memory_order_relaxed);
    }

    /**
     * Redirect output to a file opened in append mode. An empty path
     * restores stderr. Returns false if the file could not be opened, in
     * which case the current sink is kept.
     */
    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (path.empty()) {
            file_.reset();
            return true;
        }
        auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
        if (!stream->is_open()) {
            return false;
        }
        file_ = std::move(stream);
        return true;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, Args&&... args) {
        if (!is_enabled(level)) {
            return;
        }

        std::ostringstream oss;
        if (show_timestamp_.load(std::memory_order_relaxed)) {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
            std::tm tm_buf{};
            localtime_r(&time, &tm_buf);
            oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
                << '.' << std::setfill('0') << std::setw(3) << ms.count() << ' ';
        }

        oss << '[' << log_level_to_string(level) << ']';
        if (component && component[0] != '\0') {
            oss << '[' << component << ']';
        }
        oss << ' ';
        ((oss << args), ...);

        std::lock_guard<std::mutex> lock(mutex_);
        if (file_) {
            *file_ << oss.str() << '\n';
            file_->flush();
        } else {
            std::cerr << oss.str() << std::endl;
        }
    }

private:
    Logger()
        : current_level_(LogLevel::INFO)
        , show_timestamp_(true) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> current_level_;
    std::atomic<bool> show_timestamp_;
    std::unique_ptr<std::ofstream> file_;
    std::mutex mutex_;
};

// ============================================================================
// Convenience functions
// ============================================================================

inline void set_log_level(LogLevel level) {
    Logger::instance().set_level(level);
}

inline void set_log_level(const std::string& level_str) {
    Logger::instance().set_level(string_to_log_level(level_str));
}

inline LogLevel get_log_level() {
    return Logger::instance().get_level();
}

/**
 * Apply RFPINDEX_LOG_LEVEL and RFPINDEX_LOG_FILE if they are set.
 */
inline void configure_logging_from_env() {
    if (const char* level = std::getenv("RFPINDEX_LOG_LEVEL")) {
        set_log_level(std::string(level));
    }
    if (const char* file = std::getenv("RFPINDEX_LOG_FILE")) {
        if (!Logger::instance().set_log_file(file)) {
            std::cerr << "[WARN][Logging] cannot open log file " << file << ", using stderr" << std::endl;
        }
    }
}

// ============================================================================
// Logging macros
// ============================================================================

#define RFPINDEX_LOG_DEBUG(component, ...) \
    do { \
        if (rfpindex::Logger::instance().is_enabled(rfpindex::LogLevel::DEBUG)) { \
            rfpindex::Logger::instance().log(rfpindex::LogLevel::DEBUG, component, __VA_ARGS__); \
        } \
    } while (0)

#define RFPINDEX_LOG_INFO(component, ...) \
    do { \
        if (rfpindex::Logger::instance().is_enabled(rfpindex::LogLevel::INFO)) { \
            rfpindex::Logger::instance().log(rfpindex::LogLevel::INFO, component, __VA_ARGS__); \
        } \
    } while (0)

#define RFPINDEX_LOG_WARN(component, ...) \
    do { \
        if (rfpindex::Logger::instance().is_enabled(rfpindex::LogLevel::WARN)) { \
            rfpindex::Logger::instance().log(rfpindex::LogLevel::WARN, component, __VA_ARGS__); \
        } \
    } while (0)

#define RFPINDEX_LOG_ERROR(component, ...) \
    do { \
        if (rfpindex::Logger::instance().is_enabled(rfpindex::LogLevel::ERROR)) { \
            rfpindex::Logger::instance().log(rfpindex::LogLevel::ERROR, component, __VA_ARGS__); \
        } \
    } while (0)

} // namespace rfpindex
