#ifndef PROMPTGUARD_UTIL_LOGGER_HPP
#define PROMPTGUARD_UTIL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

/**
 * @file logger.hpp
 * @brief Thread-safe logging for the PromptGuard gateway.
 *
 * Usage:
 *   - Logger::getInstance().info("Info message");
 *   - logger::warn("[Gateway] something odd");
 *   - logger::enableFileOutput("promptguard.log");
 *
 * User text must go through logger::preview() before it is logged so that
 * full prompts and completions never reach the log.
 */

namespace promptguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name ("debug", "INFO", "warn"...). Returns false on unknown names.
 */
inline bool parseLogLevel(const std::string &name, LogLevel &out)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") {
        out = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        out = LogLevel::INFO;
    } else if (upper == "WARN" || upper == "WARNING") {
        out = LogLevel::WARN;
    } else if (upper == "ERROR") {
        out = LogLevel::ERROR;
    } else if (upper == "CRITICAL") {
        out = LogLevel::CRITICAL;
    } else {
        return false;
    }
    return true;
}

/**
 * @brief A singleton logger:
 *  - WARN and above go to stderr, the rest to stdout
 *  - optional mirror into a log file
 *  - messages below the configured level are dropped
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Mirror log lines into a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise truncates.
     * @return false if the file could not be opened (console logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg) { log(LogLevel::DEBUG, "DEBUG", msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, "INFO", msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, "WARN", msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, "ERROR", msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, "CRITICAL", msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const char *levelName, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << "." << std::setw(3) << std::setfill('0') << millis
             << "][" << levelName << "] " << msg << '\n';
        const std::string out = line.str();

        std::ostream &console = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        console << out;
        console.flush();

        if (fileStream_) {
            (*fileStream_) << out;
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg) { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg) { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg) { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg) { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

/**
 * @brief Shorten user-supplied text for log lines: first @p limit characters,
 *        newlines flattened, "..." appended when cut.
 */
inline std::string preview(const std::string &text, size_t limit = 50)
{
    std::string out = text.substr(0, limit);
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    if (text.size() > limit) {
        out += "...";
    }
    return out;
}

} // namespace logger
} // namespace util
} // namespace promptguard

#endif // PROMPTGUARD_UTIL_LOGGER_HPP
