/**
 * @file config.hpp
 * @brief Configuration management for the DDE administration tool
 *
 * Provides configuration structures and command line parsing for the
 * dde_admin sample application.
 */

#ifndef DDE_EXAMPLE_DDE_ADMIN_CONFIG_HPP
#define DDE_EXAMPLE_DDE_ADMIN_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dde::example {

/**
 * @brief Database configuration
 */
struct database_config {
    /// Path to SQLite database file
    std::filesystem::path path{"./dde.db"};

    /// Reject stored second entry snapshots that fail to parse
    bool strict_snapshots{false};
};

/**
 * @brief Logging configuration
 */
struct logging_config {
    /// Log level: "trace", "debug", "info", "warn", "error", "fatal"
    std::string level{"warn"};

    /// Directory for log files (empty for console only)
    std::filesystem::path directory;
};

/**
 * @brief Complete dde_admin configuration
 */
struct dde_admin_config {
    /// Database settings
    database_config database;

    /// Logging settings
    logging_config logging;

    /// Maximum wait for a form instance or discrepancy lock
    std::chrono::milliseconds lock_timeout{5000};

    /// Maximum rows per dashboard list
    std::size_t dashboard_limit{50};

    /// Command to run (first non-option argument)
    std::string command;

    /// Arguments following the command
    std::vector<std::string> arguments;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Options are accepted before the command. Everything after the
     * command is passed to it unchanged.
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<dde_admin_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace dde::example

#endif  // DDE_EXAMPLE_DDE_ADMIN_CONFIG_HPP
