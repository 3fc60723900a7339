// logging.h - Structured logging for mbkit
// Leveled, category-tagged console/file logging with rotation
#ifndef MBK_LOGGING_H
#define MBK_LOGGING_H

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <functional>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <thread>

namespace mbk {
namespace logging {

// =============================================================================
// Log Levels
// =============================================================================

enum class Level {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

inline const char* level_to_string(Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::FATAL: return "FATAL";
        default:           return "UNKNOWN";
    }
}

inline const char* level_to_color(Level level) {
    switch (level) {
        case Level::TRACE: return "\033[0;37m"; // White
        case Level::DEBUG: return "\033[0;36m"; // Cyan
        case Level::INFO:  return "\033[0;32m"; // Green
        case Level::WARN:  return "\033[0;33m"; // Yellow
        case Level::ERROR: return "\033[0;31m"; // Red
        case Level::FATAL: return "\033[1;31m"; // Bold Red
        default:           return "\033[0m";
    }
}

// =============================================================================
// Log Categories (tag each line with the subsystem)
// =============================================================================

enum class Category {
    NONE,
    STORE,
    SCAN,
    STREAM,
    ARCHIVE,
    CLI,
    BENCH
};

inline const char* category_to_string(Category cat) {
    switch (cat) {
        case Category::STORE:       return "store";
        case Category::SCAN:        return "scan";
        case Category::STREAM:      return "stream";
        case Category::ARCHIVE:     return "archive";
        case Category::CLI:         return "cli";
        case Category::BENCH:       return "bench";
        default:                    return "unknown";
    }
}

inline bool parse_level(const std::string& name, Level& out) {
    std::string s;
    for (char c : name) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") { out = Level::TRACE; return true; }
    if (s == "debug") { out = Level::DEBUG; return true; }
    if (s == "info")  { out = Level::INFO;  return true; }
    if (s == "warn")  { out = Level::WARN;  return true; }
    if (s == "error") { out = Level::ERROR; return true; }
    if (s == "fatal") { out = Level::FATAL; return true; }
    if (s == "off")   { out = Level::OFF;   return true; }
    return false;
}

// =============================================================================
// Log Entry
// =============================================================================

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    Level level;
    Category category;
    std::string message;
    std::thread::id thread_id;

    std::string format() const {
        std::ostringstream ss;

        // Timestamp
        auto time_t = std::chrono::system_clock::to_time_t(timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()) % 1000;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count();

        // Level
        ss << " [" << std::setw(5) << level_to_string(level) << "]";

        // Category
        if (category != Category::NONE) {
            ss << " [" << category_to_string(category) << "]";
        }

        // Thread ID (last 4 digits)
        std::ostringstream tid_ss;
        tid_ss << thread_id;
        std::string tid_str = tid_ss.str();
        if (tid_str.length() > 4) {
            tid_str = tid_str.substr(tid_str.length() - 4);
        }
        ss << " [" << tid_str << "]";

        // Message
        ss << " " << message;

        return ss.str();
    }

    std::string format_colored() const {
        std::ostringstream ss;
        const char* color = level_to_color(level);
        const char* reset = "\033[0m";

        // Timestamp (dim)
        auto time_t = std::chrono::system_clock::to_time_t(timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()) % 1000;
        ss << "\033[2m";
        ss << std::put_time(std::localtime(&time_t), "%H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count();
        ss << reset;

        // Level (colored)
        ss << " " << color << "[" << std::setw(5) << level_to_string(level) << "]" << reset;

        // Category (cyan)
        if (category != Category::NONE) {
            ss << " \033[0;36m[" << category_to_string(category) << "]\033[0m";
        }

        // Message
        ss << " " << message;

        return ss.str();
    }

    std::string format_json() const {
        std::ostringstream ss;

        auto time_t = std::chrono::system_clock::to_time_t(timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()) % 1000;

        ss << "{";
        ss << "\"timestamp\":\"";
        ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\"";
        ss << ",\"level\":\"" << level_to_string(level) << "\"";
        if (category != Category::NONE) {
            ss << ",\"category\":\"" << category_to_string(category) << "\"";
        }
        ss << ",\"message\":\"" << escape_json(message) << "\"";
        ss << "}";

        return ss.str();
    }

private:
    static std::string escape_json(const std::string& s) {
        std::string result;
        result.reserve(s.length());
        for (char c : s) {
            switch (c) {
                case '"':  result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default:   result += c; break;
            }
        }
        return result;
    }
};

// =============================================================================
// Logger
// =============================================================================

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Configuration
    void set_level(Level level) { min_level_ = level; }

    void set_console_output(bool enable) { console_output_ = enable; }
    void set_file_output(bool enable) { file_output_ = enable; }
    void set_json_format(bool enable) { json_format_ = enable; }
    void set_color_output(bool enable) { color_output_ = enable; }

    // File output
    bool open_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(path, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }
        log_path_ = path;
        return true;
    }

    void close_log_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    // Main logging function
    void log(Level level, Category category, const std::string& message) {
        if (level < min_level_) return;

        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = level;
        entry.category = category;
        entry.message = message;
        entry.thread_id = std::this_thread::get_id();

        std::lock_guard<std::mutex> lock(mutex_);

        // Console output (stderr, stdout carries command output)
        if (console_output_) {
            if (json_format_) {
                std::cerr << entry.format_json() << std::endl;
            } else if (color_output_) {
                std::cerr << entry.format_colored() << std::endl;
            } else {
                std::cerr << entry.format() << std::endl;
            }
        }

        // File output
        if (file_output_ && log_file_.is_open()) {
            if (json_format_) {
                log_file_ << entry.format_json() << std::endl;
            } else {
                log_file_ << entry.format() << std::endl;
            }

            // Check for rotation
            log_lines_++;
            if (log_lines_ >= max_log_lines_) {
                rotate_log();
                log_lines_ = 0;
            }
        }

        // Callbacks
        for (const auto& callback : callbacks_) {
            callback(entry);
        }
    }

    // Add callback for custom log handling
    void add_callback(std::function<void(const LogEntry&)> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.push_back(callback);
    }

    void clear_callbacks() {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.clear();
    }

private:
    // Caller holds mutex_
    void rotate_log() {
        if (!log_file_.is_open() || log_path_.empty()) return;

        log_file_.close();

        // Rename current log to .old
        std::string old_path = log_path_ + ".old";
        std::remove(old_path.c_str());
        std::rename(log_path_.c_str(), old_path.c_str());

        // Reopen
        log_file_.open(log_path_, std::ios::app);
    }

    Logger()
        : min_level_(Level::INFO)
        , console_output_(true)
        , file_output_(false)
        , json_format_(false)
        , color_output_(true)
        , log_lines_(0)
        , max_log_lines_(100000) {}

    ~Logger() {
        close_log_file();
    }

    Level min_level_;
    bool console_output_;
    bool file_output_;
    bool json_format_;
    bool color_output_;

    std::string log_path_;
    std::ofstream log_file_;
    size_t log_lines_;
    size_t max_log_lines_;

    std::vector<std::function<void(const LogEntry&)>> callbacks_;
    std::mutex mutex_;
};

// =============================================================================
// Logging Macros
// =============================================================================

#define MBK_LOG(level, msg) \
    mbk::logging::Logger::instance().log(level, mbk::logging::Category::NONE, msg)

#define MBK_LOG_CAT(level, cat, msg) \
    mbk::logging::Logger::instance().log(level, cat, msg)

#define LOG_ERROR(msg) MBK_LOG(mbk::logging::Level::ERROR, msg)

// Category-specific macros
#define LOG_STORE(level, ...)    MBK_LOG_CAT(level, mbk::logging::Category::STORE, __VA_ARGS__)
#define LOG_SCAN(level, ...)     MBK_LOG_CAT(level, mbk::logging::Category::SCAN, __VA_ARGS__)
#define LOG_STREAM(level, ...)   MBK_LOG_CAT(level, mbk::logging::Category::STREAM, __VA_ARGS__)
#define LOG_ARCHIVE(level, ...)  MBK_LOG_CAT(level, mbk::logging::Category::ARCHIVE, __VA_ARGS__)
#define LOG_CLI(level, ...)      MBK_LOG_CAT(level, mbk::logging::Category::CLI, __VA_ARGS__)

// =============================================================================
// Scoped Timer for Performance Logging
// =============================================================================

class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& name, Level level = Level::DEBUG)
        : name_(name), level_(level) {
        start_ = std::chrono::high_resolution_clock::now();
    }

    ~ScopedLogTimer() {
        auto end = std::chrono::high_resolution_clock::now();
        auto ms = std::chrono::duration<double, std::milli>(end - start_).count();

        std::ostringstream ss;
        ss << name_ << " completed in " << std::fixed << std::setprecision(2) << ms << " ms";

        Logger::instance().log(level_, Category::BENCH, ss.str());
    }

private:
    std::string name_;
    Level level_;
    std::chrono::high_resolution_clock::time_point start_;
};

// =============================================================================
// Conditional Logging
// =============================================================================

// Every N calls
#define LOG_EVERY_N(n, level, ...) \
    do { \
        static int _count_##__LINE__ = 0; \
        if (++_count_##__LINE__ >= (n)) { \
            _count_##__LINE__ = 0; \
            MBK_LOG(level, __VA_ARGS__); \
        } \
    } while(0)

} // namespace logging
} // namespace mbk

#endif // MBK_LOGGING_H
