/**
 * @file logger_adapter.hpp
 * @brief Adapter for application logging using logger_system
 *
 * This file provides the logger_adapter class for routing jobq diagnostics
 * through logger_system. It owns a single process-wide logger with console
 * and rotating file writers.
 */

#pragma once

#include <jobq/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace jobq::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Base name of the rotating log file
    std::string file_name{"jobq.log"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Until initialize() is called every log call is a no-op, so library code
 * can log unconditionally.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/worker";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("worker started with {} handlers", count);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and starts the underlying logger.
     * A second call without an intervening shutdown() is ignored.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, jobq::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, jobq::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, jobq::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, jobq::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, jobq::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, jobq::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    /**
     * @brief Convert a level to its upper-case name ("INFO", "WARN", ...)
     */
    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace jobq::integration
