/**
 * @file main.cpp
 * @brief DDE Admin - command line driver for double data entry
 *
 * Registers form instances, records first and second entries, compares
 * them, resolves discrepancies and shows the dashboard, all against one
 * SQLite database.
 *
 * Usage:
 *   dde_admin [OPTIONS] <command> [ARGS...]
 *
 * Example:
 *   dde_admin --db-path ./trial.db submit-second 1 bob 101=120 102=85
 */

#include "admin_app.hpp"
#include "config.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    // Parse command line arguments
    auto config = dde::example::dde_admin_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    dde::example::dde_admin_app app(std::move(config.value()));

    if (!app.initialize()) {
        std::cerr << "Failed to initialize dde_admin\n";
        return 1;
    }

    return app.run();
}
