#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace compartmental {

/**
 * @enum LogLevel
 * @brief Severity levels for log messages, in increasing order.
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger shared by the engine and the driver.
 *
 * Writes timestamped lines of the form `YYYY-mm-dd HH:MM:SS [LEVEL] [source] message`
 * to the console (stdout, or stderr for ERROR and above) and, when enabled, to a log file.
 * Messages below the configured minimum level are dropped.
 */
class Logger {
public:
    /**
     * @brief Retrieves the singleton instance of the Logger.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     */
    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Silences or restores console output. File output is unaffected.
     */
    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleOutput_ = enabled;
    }

    /**
     * @brief Enables (append mode) or disables logging to a file.
     *
     * @param enable   True to enable file logging, false to disable.
     * @param filename Path of the log file, used only when enabling.
     * @return bool False if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "compartmental.log") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (logFile_.is_open()) {
                logFile_.close();
            }
            if (enable) {
                logFile_.open(filename, std::ios::app);
                if (!logFile_.is_open()) {
                    std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                    return false;
                }
            }
        }
        if (enable) {
            log(LogLevel::INFO, "Logger", "File logging enabled to: " + filename);
        }
        return true;
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) return;

        std::string formattedMessage = formatLogMessage(level, source, message);
        if (consoleOutput_) {
            std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
            out << formattedMessage << std::endl;
        }
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO), consoleOutput_(true) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        oss << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    LogLevel logLevel_;
    bool consoleOutput_;
    std::ofstream logFile_;
    mutable std::mutex mutex_;
};

/**
 * @brief Converts a level name (debug, info, warning, error, fatal; any case) to a LogLevel.
 *
 * @throws ConfigurationException If the name is not a known level.
 */
LogLevel parseLogLevel(const std::string& name);

} // namespace compartmental

#endif // LOGGER_H
