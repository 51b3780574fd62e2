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

namespace episim {

/**
 * @enum LogLevel
 * @brief Defines severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information.
    INFO,     ///< General informational messages.
    WARNING,  ///< Indicates potential issues.
    ERROR,    ///< Errors hindering specific operations.
    FATAL,    ///< Critical errors halting the program.
    SILENT    ///< Threshold only: suppresses every message.
};

/**
 * @brief Parses a command-line log level name.
 *
 * Accepts debug, info, warn/warning, error, fatal and silent (case-insensitive).
 * @param name [in] Level name.
 * @param fallback [in] Level returned for an unrecognised name.
 */
inline LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    if (lower == "silent" || lower == "off") return LogLevel::SILENT;
    return fallback;
}

/**
 * @class Logger
 * @brief A thread-safe logger for the simulation pipeline.
 *
 * Provides logging to a console stream and optionally to a file.
 * Messages are timestamped and categorized by severity level and source.
 *
 * Each run owns a Logger and hands it down the pipeline by reference, so two
 * runs in one process never share a threshold or a file sink. getInstance()
 * returns a process-wide default for code that is not part of a run.
 */
class Logger {
public:
    /**
     * @brief Creates a logger writing to the given console stream.
     * @param level [in] Minimum level to output.
     * @param console [in] Stream receiving formatted messages (std::cout by default).
     */
    explicit Logger(LogLevel level = LogLevel::INFO, std::ostream& console = std::cout)
        : logLevel_(level), console_(&console) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Retrieves the process-wide default logger.
     * @return Logger& Reference to the shared instance.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const { return logLevel_; }

    /**
     * @brief Configures file logging.
     *
     * Enables or disables logging to a specified file. The file is opened in
     * append mode; an already open file is closed first.
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] The path to the log file (used only if enable is true).
     * @return bool True if the requested state was achieved, false if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "episim.log") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (enable) {
            if (logFile_.is_open()) {
                logFile_.close();
            }
            logFile_.open(filename, std::ios::app);
            if (!logFile_.is_open()) {
                std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                return false;
            }
            return true;
        } else {
            if (logFile_.is_open()) {
                logFile_.close();
            }
            return true;
        }
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier for the source of the message (class or function name).
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (level < logLevel_ || level == LogLevel::SILENT) return;

        std::string formattedMessage = formatLogMessage(level, source, message);

        std::lock_guard<std::mutex> lock(mutex_);
        (*console_) << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    /** @brief Logs a message with DEBUG level. @param source Source identifier. @param message Message content. */
    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    /** @brief Logs a message with INFO level. @param source Source identifier. @param message Message content. */
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    /** @brief Logs a message with WARNING level. @param source Source identifier. @param message Message content. */
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    /** @brief Logs a message with ERROR level. @param source Source identifier. @param message Message content. */
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    /** @brief Logs a message with FATAL level. @param source Source identifier. @param message Message content. */
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    /**
     * @brief Formats a log entry with timestamp, level, source, and message.
     */
    std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
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
            case LogLevel::SILENT:  break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    LogLevel logLevel_;         ///< Minimum level for messages to be processed.
    std::ostream* console_;     ///< Console sink.
    std::ofstream logFile_;     ///< Output file stream (if file logging is enabled).
    std::mutex mutex_;          ///< Ensures thread safety for log operations.
};

} // namespace episim

#endif // LOGGER_H
