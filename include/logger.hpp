#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <optional>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background writer
 * thread. Calling it again switches to the new file; when the new file cannot
 * be opened the previous one stays active.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files instead of keeping them as plain text.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has an open log file.
 */
bool logger_initialized();

/**
 * @brief Parse a level name such as `DEBUG` or `warning`.
 *
 * @return Matching level or `std::nullopt` for an unknown name.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/** @return Upper-case label used in log lines for @p level. */
const char* log_level_name(LogLevel level);

/**
 * @brief Log a message at a fixed severity.
 *
 * The overloads taking @p fields append them as `key=value` pairs, or as
 * extra members when JSON logging is enabled.
 */
void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log entries to syslog using the given facility.
 *
 * Only effective on Linux; a no-op elsewhere.
 */
void init_syslog(int facility = 0);

/**
 * @brief Block until every queued entry has been written.
 */
void flush_logger();

/**
 * @brief Write out queued entries, stop the writer thread and close the file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
