/**
 * @file cpp_logger.h
 * @brief Defines the logging framework used throughout the voice engine.
 * @details Log messages are formatted printf-style, stamped with their source file and
 *          line, and queued in a bounded in-process buffer. A consumer (the executable's
 *          log pump, or a test) drains the buffer with `retrieve_log_entries`.
 */
#ifndef CPP_LOGGER_H
#define CPP_LOGGER_H

#include <string>
#include <vector>
#include <atomic>

namespace voicetap {
namespace audio {
namespace logging {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,   ///< Detailed information, typically of interest only when diagnosing problems.
    INFO,    ///< Confirmation that things are working as expected.
    WARNING, ///< An indication that something unexpected happened, or a potential problem.
    ERR      ///< A serious problem, preventing the program from performing a function.
};

/** @brief Global atomic variable to hold the current log level. */
extern std::atomic<LogLevel> current_log_level;

/**
 * @struct LogEntry
 * @brief Represents a single log message.
 */
struct LogEntry {
    LogLevel level;         ///< The severity level of the log message.
    std::string message;    ///< The log message content.
    std::string filename;   ///< The source file where the log was generated.
    int line_number;        ///< The line number in the source file.
};

/**
 * @brief Retrieves buffered log entries.
 * @details Blocks until messages are available, shutdown is requested, or the timeout
 *          expires, then returns at most 100 entries and removes them from the queue.
 * @param timeout_ms The maximum time to wait in milliseconds.
 * @return A vector of `LogEntry` objects, empty on timeout.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/**
 * @brief Signals the logger to prepare for shutdown.
 * @details Unblocks any thread waiting in `retrieve_log_entries`. Messages logged after
 *          this call are discarded.
 */
void shutdown_cpp_logger();

/**
 * @brief Sets the global log level.
 * @param level Messages below this level are discarded before formatting.
 */
void set_cpp_log_level(LogLevel level);

/**
 * @brief Parses a level name ("debug", "info", "warning", "error").
 * @param name Case-insensitive level name.
 * @param out_level Receives the parsed level on success.
 * @return true if the name was recognised.
 */
bool parse_log_level(const std::string& name, LogLevel& out_level);

/** @brief Returns the upper-case display name of a level. */
const char* log_level_name(LogLevel level);

/**
 * @brief Dispatches a log message to the internal queue.
 * @param level The log level.
 * @param file The source file name (`__FILE__`).
 * @param line The source line number (`__LINE__`).
 * @param format The printf-style format string.
 * @param ... Arguments for the format string.
 */
void log_message(LogLevel level, const char* file, int line, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

/**
 * @brief Helper function to extract the base filename from a full path.
 * @param path The full path to the file.
 * @return A pointer to the base filename within the path string.
 */
const char* get_base_filename(const char* path);

} // namespace logging
} // namespace audio
} // namespace voicetap

/**
 * @def LOG_CPP_BASE
 * @brief A base macro for logging. Not intended for direct use.
 */
#define LOG_CPP_BASE(level, fmt, ...) \
    voicetap::audio::logging::log_message( \
        level, \
        voicetap::audio::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

/** @def LOG_CPP_DEBUG(fmt, ...) @brief Logs a message at the DEBUG level. */
#define LOG_CPP_DEBUG(fmt, ...)   LOG_CPP_BASE(voicetap::audio::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_INFO(fmt, ...) @brief Logs a message at the INFO level. */
#define LOG_CPP_INFO(fmt, ...)    LOG_CPP_BASE(voicetap::audio::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_WARNING(fmt, ...) @brief Logs a message at the WARNING level. */
#define LOG_CPP_WARNING(fmt, ...) LOG_CPP_BASE(voicetap::audio::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_ERROR(fmt, ...) @brief Logs a message at the ERROR level. */
#define LOG_CPP_ERROR(fmt, ...)   LOG_CPP_BASE(voicetap::audio::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // CPP_LOGGER_H
