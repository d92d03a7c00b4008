/**
 * @file admin_app.hpp
 * @brief DDE administration application class
 *
 * Opens the SQLite store, wires the DDE engine around it, and runs one
 * command per invocation.
 */

#ifndef DDE_EXAMPLE_DDE_ADMIN_ADMIN_APP_HPP
#define DDE_EXAMPLE_DDE_ADMIN_ADMIN_APP_HPP

#include "config.hpp"

#include <dde/storage/sqlite_dde_storage.hpp>
#include <dde/workflow/dde_engine.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dde::example {

/**
 * @brief Command line front end over dde_engine
 *
 * Commands print their outcome to stdout. Failures are printed to stderr
 * with the error kind and message, and run() returns a non-zero exit code.
 */
class dde_admin_app {
public:
    explicit dde_admin_app(dde_admin_config config);
    ~dde_admin_app();

    dde_admin_app(const dde_admin_app&) = delete;
    dde_admin_app& operator=(const dde_admin_app&) = delete;

    /**
     * @brief Initialize logging, open the database and build the engine
     * @return true if initialization succeeded
     */
    auto initialize() -> bool;

    /**
     * @brief Run the configured command
     * @return Process exit code
     */
    auto run() -> int;

private:
    using args_t = std::vector<std::string>;
    using handler_t = std::function<int(const args_t&)>;

    auto cmd_register_form(const args_t& args) -> int;
    auto cmd_add_field(const args_t& args) -> int;
    auto cmd_start(const args_t& args) -> int;
    auto cmd_complete_first(const args_t& args) -> int;
    auto cmd_can_enter(const args_t& args) -> int;
    auto cmd_submit_second(const args_t& args) -> int;
    auto cmd_compare(const args_t& args) -> int;
    auto cmd_discrepancies(const args_t& args) -> int;
    auto cmd_resolve(const args_t& args) -> int;
    auto cmd_finalize(const args_t& args) -> int;
    auto cmd_status(const args_t& args) -> int;
    auto cmd_audit(const args_t& args) -> int;
    auto cmd_dashboard(const args_t& args) -> int;

    static void print_comparison(const workflow::comparison_result& result);
    static auto report_error(const error_info& error) -> int;

    dde_admin_config config_;
    std::shared_ptr<storage::sqlite_dde_storage> storage_;
    std::unique_ptr<workflow::dde_engine> engine_;
    std::map<std::string, handler_t> handlers_;
};

}  // namespace dde::example

#endif  // DDE_EXAMPLE_DDE_ADMIN_ADMIN_APP_HPP
