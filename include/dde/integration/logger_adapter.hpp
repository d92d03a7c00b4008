/**
 * @file logger_adapter.hpp
 * @brief Adapter for DDE engine logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the double data-entry engine. It supports standard logging and a
 * security event trail for entry denials and lock contention.
 *
 * The security event trail is an operational log. The mandatory record of
 * data changes is written through the audit sink of the storage layer.
 */

#pragma once

#include <dde/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace dde::integration {

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

/**
 * @enum security_event_type
 * @brief Types of security events recorded in the security trail
 */
enum class security_event_type {
    entry_denied,
    same_entrant_rejected,
    lock_timeout,
    invalid_request
};

/// Event name written to the security trail, e.g. "LOCK_TIMEOUT"
[[nodiscard]] auto to_string(security_event_type type) -> std::string;

/**
 * @struct security_event
 * @brief One line of the security trail
 */
struct security_event {
    security_event_type type{security_event_type::entry_denied};
    std::string description;
    std::string user_id;
};

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the JSON security event trail
    bool enable_security_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @brief Parse a log level name ("trace" .. "fatal", "off")
 * @return true and sets @p level when the name is known
 */
[[nodiscard]] auto parse_log_level(const std::string& name, log_level& level)
    -> bool;

/**
 * @class logger_adapter
 * @brief Static logging facade used throughout the DDE engine
 *
 * Messages logged before initialize() or after shutdown() are dropped, so
 * library code may log unconditionally.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/dde";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Form {} reconciled by {}", form_id, user_id);
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
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release resources
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(dde::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, dde::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(dde::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, dde::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(dde::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, dde::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(dde::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, dde::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(dde::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, dde::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(dde::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, dde::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Security Event Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Log a security-related event
     *
     * Writes a warning to the application log and, when enabled, appends a
     * JSON line to the security event trail.
     *
     * @param type Type of security event
     * @param description Human-readable description
     * @param user_id Acting user, if known
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& user_id = "");

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace dde::integration
