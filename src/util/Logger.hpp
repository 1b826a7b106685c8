/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility with file rotation
 *
 * Structured log lines with ISO 8601 timestamps, a level and a component
 * tag. Files rotate by size; rotated files are kept up to a configured count.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-file and per-retry details
    INFO,     ///< Operation start and outcome
    WARNING,  ///< Per-file failures, retries, partial results
    ERROR     ///< Failed operations and unexpected exceptions
};

/**
 * @brief Parse a level name from configuration ("debug", "INFO", "warn", ...)
 * @return Parsed level, or std::nullopt for unknown names
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;  ///< Rotate once the file reaches this size
    int max_files = 7;                               ///< Rotated files to keep
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger with file output and rotation
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.initialize(data_dir / "media-transfer" / "logs", "media-transfer-cli");
 * LOG_INFO("FileOperationService", "Copy of 3 item(s) started");
 * @endcode
 *
 * Before initialize() is called messages only reach stderr (when console
 * output is enabled), so library code can log unconditionally.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Initialize the logger with output directory and application name
     * @param log_dir Directory for log files (created if missing)
     * @param app_name Application name used in the log filename
     * @param min_level Minimum level to log
     * @param policy Rotation policy
     * @return true if the log file could be opened
     *
     * Log files are named {app_name}.log, rotated files {app_name}.1.log,
     * {app_name}.2.log and so on.
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO,
                    LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Also write every accepted line to stderr
     */
    void set_console_output(bool enable);

    /**
     * @brief Path of the active log file, or empty if not initialized
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

private:
    Logger() = default;
    ~Logger();

    /// "2026-01-22T14:32:45.123Z "
    [[nodiscard]] static auto get_timestamp() -> std::string;
    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    [[nodiscard]] auto rotated_path(int index) const -> std::filesystem::path;
    void check_and_rotate();
    void rotate_logs();
    auto open_log_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
