/**
 * @file config.cpp
 * @brief Configuration management implementation for the DDE administration tool
 */

#include "config.hpp"

#include <iostream>
#include <stdexcept>

namespace dde::example {

void dde_admin_config::print_help() {
    std::cout << R"(
DDE Admin - Double Data Entry Reconciliation

Usage: dde_admin [OPTIONS] <command> [ARGS...]

Options:
  --db-path <path>          SQLite database path (default: ./dde.db)
  --log-level <level>       Log level: trace, debug, info, warn, error, fatal
                            (default: warn)
  --log-dir <path>          Also write logs to this directory
  --lock-timeout-ms <ms>    Lock wait timeout in milliseconds (default: 5000)
  --dashboard-limit <n>     Maximum rows per dashboard list (default: 50)
  --strict-snapshots        Fail on malformed stored second entries
  --help, -h                Show this help message

Commands:
  register-form <subject> <site> <form> <event> [--single-entry]
  add-field <form-id> <item-id> <item-name> [value]
  start <form-id> <user>
  complete-first <form-id> <user>
  can-enter <form-id> <user>
  submit-second <form-id> <user> <item-id>=<value>...
  compare <form-id> [user]
  discrepancies <form-id>
  resolve <discrepancy-id> <strategy> <user> [--value <v>] [--notes <text>]
          strategy: first_correct, second_correct, new_value, adjudicated
  finalize <form-id> <user>
  status <form-id>
  audit <form-id>
  dashboard [site]

Examples:
  # Register a form instance with two items
  dde_admin register-form SITE01-0042 SITE01 Vitals Baseline
  dde_admin add-field 1 101 SYSBP 120
  dde_admin add-field 1 102 DIABP 80

  # First entry by one user, second entry by another
  dde_admin complete-first 1 alice
  dde_admin submit-second 1 bob 101=120 102=85

  # Resolve the mismatch and finalize
  dde_admin resolve 1 first_correct carol --notes "Source document checked"
  dde_admin finalize 1 carol

)";
}

auto dde_admin_config::parse_args(int argc, char* argv[])
    -> std::optional<dde_admin_config> {

    dde_admin_config config;

    int i = 1;
    for (; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--db-path") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --db-path requires a value\n";
                return std::nullopt;
            }
            config.database.path = argv[++i];
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-level requires a value\n";
                return std::nullopt;
            }
            config.logging.level = argv[++i];
            continue;
        }

        if (arg == "--log-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-dir requires a value\n";
                return std::nullopt;
            }
            config.logging.directory = argv[++i];
            continue;
        }

        if (arg == "--lock-timeout-ms") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --lock-timeout-ms requires a value\n";
                return std::nullopt;
            }
            try {
                auto ms = std::stol(argv[++i]);
                if (ms < 0) {
                    throw std::out_of_range("negative timeout");
                }
                config.lock_timeout = std::chrono::milliseconds{ms};
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid lock timeout\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--dashboard-limit") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --dashboard-limit requires a value\n";
                return std::nullopt;
            }
            try {
                auto limit = std::stol(argv[++i]);
                if (limit <= 0) {
                    throw std::out_of_range("non-positive limit");
                }
                config.dashboard_limit = static_cast<std::size_t>(limit);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid dashboard limit\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--strict-snapshots") {
            config.database.strict_snapshots = true;
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }

        break;
    }

    if (i >= argc) {
        std::cerr << "Error: No command given\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    config.command = argv[i++];
    for (; i < argc; ++i) {
        config.arguments.emplace_back(argv[i]);
    }

    return config;
}

}  // namespace dde::example
