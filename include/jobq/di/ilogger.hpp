/**
 * @file ilogger.hpp
 * @brief Logger interface for dependency injection
 *
 * This file provides the ILogger interface and implementations (NullLogger,
 * LoggerService) injected into the queue manager, the stores and the
 * logging event emitter.
 */

#pragma once

#include <jobq/integration/logger_adapter.hpp>
#include <jobq/compat/format.hpp>

#include <memory>
#include <string_view>
#include <utility>

namespace jobq::di {

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Abstract logger interface for dependency injection
 *
 * Every long-lived jobq component takes a std::shared_ptr<ILogger> so
 * tests can capture output with a mock and applications can route it to
 * logger_system through LoggerService.
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations
 * - Logging from multiple threads should be properly serialized
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    // =========================================================================
    // Log Level Methods
    // =========================================================================

    /**
     * @brief Log a trace-level message
     * @param message The message to log
     */
    virtual void trace(std::string_view message) = 0;

    /**
     * @brief Log a debug-level message
     * @param message The message to log
     */
    virtual void debug(std::string_view message) = 0;

    /**
     * @brief Log an info-level message
     * @param message The message to log
     */
    virtual void info(std::string_view message) = 0;

    /**
     * @brief Log a warning-level message
     * @param message The message to log
     */
    virtual void warn(std::string_view message) = 0;

    /**
     * @brief Log an error-level message
     * @param message The message to log
     */
    virtual void error(std::string_view message) = 0;

    /**
     * @brief Log a fatal-level message
     * @param message The message to log
     */
    virtual void fatal(std::string_view message) = 0;

    // =========================================================================
    // Level Check
    // =========================================================================

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    // =========================================================================
    // Formatted Logging (Convenience Templates)
    // =========================================================================

    /**
     * @brief Log a formatted trace-level message
     */
    template <typename... Args>
    void trace_fmt(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::trace)) {
            trace(jobq::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Log a formatted debug-level message
     */
    template <typename... Args>
    void debug_fmt(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(jobq::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Log a formatted info-level message
     */
    template <typename... Args>
    void info_fmt(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(jobq::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Log a formatted warning-level message
     */
    template <typename... Args>
    void warn_fmt(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(jobq::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Log a formatted error-level message
     */
    template <typename... Args>
    void error_fmt(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(jobq::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Log a formatted fatal-level message
     */
    template <typename... Args>
    void fatal_fmt(jobq::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::fatal)) {
            fatal(jobq::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
    ILogger(ILogger&&) = default;
    ILogger& operator=(ILogger&&) = default;
};

// =============================================================================
// Null Logger Implementation
// =============================================================================

/**
 * @brief No-op logger used when no logger is injected
 */
class NullLogger final : public ILogger {
public:
    NullLogger() = default;
    ~NullLogger() override = default;

    void trace(std::string_view /*message*/) override {}
    void debug(std::string_view /*message*/) override {}
    void info(std::string_view /*message*/) override {}
    void warn(std::string_view /*message*/) override {}
    void error(std::string_view /*message*/) override {}
    void fatal(std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

// =============================================================================
// Logger Service Implementation
// =============================================================================

/**
 * @brief Default implementation of ILogger using logger_adapter
 *
 * LoggerService delegates all logging operations to the static
 * logger_adapter methods, providing dependency injection support
 * for the existing logging infrastructure.
 *
 * Thread Safety:
 * - All methods are thread-safe (delegates to thread-safe logger_adapter)
 */
class LoggerService final : public ILogger {
public:
    LoggerService() = default;
    ~LoggerService() override = default;

    void trace(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::trace, std::string{message});
    }

    void debug(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::debug, std::string{message});
    }

    void info(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::info, std::string{message});
    }

    void warn(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::warn, std::string{message});
    }

    void error(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::error, std::string{message});
    }

    void fatal(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::fatal, std::string{message});
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }
};

// =============================================================================
// Global Null Logger Instance
// =============================================================================

/**
 * @brief Get a shared null logger instance
 *
 * Returns a singleton NullLogger instance for use as a default.
 * This avoids repeated allocations when services need a default logger.
 *
 * @return Shared pointer to NullLogger
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace jobq::di
