/**
 * @file admin_app.cpp
 * @brief DDE administration application implementation
 */

#include "admin_app.hpp"

#include <dde/compat/time.hpp>
#include <dde/integration/logger_adapter.hpp>

#include <iomanip>
#include <iostream>

namespace dde::example {

using integration::logger_adapter;

namespace {

auto parse_id(const std::string& text, int64_t& id) -> bool {
    try {
        std::size_t pos = 0;
        auto value = std::stoll(text, &pos);
        if (pos != text.size() || value <= 0) {
            return false;
        }
        id = static_cast<int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

auto usage_error(const std::string& usage) -> int {
    std::cerr << "Usage: dde_admin " << usage << "\n";
    return 2;
}

auto display(const std::string& value) -> std::string {
    return value.empty() ? "-" : value;
}

auto display(std::chrono::system_clock::time_point tp) -> std::string {
    return display(compat::to_timestamp_string(tp));
}

}  // namespace

dde_admin_app::dde_admin_app(dde_admin_config config)
    : config_(std::move(config)) {
    handlers_ = {
        {"register-form", [this](const args_t& a) { return cmd_register_form(a); }},
        {"add-field", [this](const args_t& a) { return cmd_add_field(a); }},
        {"start", [this](const args_t& a) { return cmd_start(a); }},
        {"complete-first", [this](const args_t& a) { return cmd_complete_first(a); }},
        {"can-enter", [this](const args_t& a) { return cmd_can_enter(a); }},
        {"submit-second", [this](const args_t& a) { return cmd_submit_second(a); }},
        {"compare", [this](const args_t& a) { return cmd_compare(a); }},
        {"discrepancies", [this](const args_t& a) { return cmd_discrepancies(a); }},
        {"resolve", [this](const args_t& a) { return cmd_resolve(a); }},
        {"finalize", [this](const args_t& a) { return cmd_finalize(a); }},
        {"status", [this](const args_t& a) { return cmd_status(a); }},
        {"audit", [this](const args_t& a) { return cmd_audit(a); }},
        {"dashboard", [this](const args_t& a) { return cmd_dashboard(a); }},
    };
}

dde_admin_app::~dde_admin_app() {
    engine_.reset();
    storage_.reset();
    logger_adapter::shutdown();
}

auto dde_admin_app::initialize() -> bool {
    integration::logger_config log_config;
    if (!integration::parse_log_level(config_.logging.level, log_config.min_level)) {
        std::cerr << "Error: Unknown log level: " << config_.logging.level << "\n";
        return false;
    }
    log_config.enable_console = true;
    log_config.enable_file = !config_.logging.directory.empty();
    log_config.enable_security_log = !config_.logging.directory.empty();
    if (!config_.logging.directory.empty()) {
        log_config.log_directory = config_.logging.directory;
    }
    log_config.async_mode = false;
    logger_adapter::initialize(log_config);

    storage::sqlite_storage_config db_config;
    db_config.strict_snapshot_parsing = config_.database.strict_snapshots;

    auto opened = storage::sqlite_dde_storage::open(config_.database.path.string(),
                                                    db_config);
    if (opened.is_err()) {
        std::cerr << "Failed to open database " << config_.database.path << ": "
                  << opened.error().message << "\n";
        return false;
    }
    storage_ = std::shared_ptr<storage::sqlite_dde_storage>(std::move(opened.value()));

    workflow::dde_workflow_config engine_config;
    engine_config.lock_wait_timeout = config_.lock_timeout;
    engine_config.dashboard_limit = config_.dashboard_limit;
    engine_ = std::make_unique<workflow::dde_engine>(storage_, engine_config);

    logger_adapter::debug("dde_admin opened {} (schema v{})", storage_->path(),
                          storage_->schema_version());
    return true;
}

auto dde_admin_app::run() -> int {
    auto it = handlers_.find(config_.command);
    if (it == handlers_.end()) {
        std::cerr << "Error: Unknown command: " << config_.command << "\n";
        std::cerr << "Use --help for usage information\n";
        return 2;
    }
    return it->second(config_.arguments);
}

auto dde_admin_app::report_error(const error_info& error) -> int {
    std::cerr << to_string(classify(error.code)) << ": " << error.message << "\n";
    return 1;
}

// =============================================================================
// Seeding
// =============================================================================

auto dde_admin_app::cmd_register_form(const args_t& args) -> int {
    if (args.size() < 4 || args.size() > 5 ||
        (args.size() == 5 && args[4] != "--single-entry")) {
        return usage_error("register-form <subject> <site> <form> <event> [--single-entry]");
    }

    storage::form_instance_registration registration;
    registration.subject_label = args[0];
    registration.site_id = args[1];
    registration.form_name = args[2];
    registration.event_name = args[3];
    registration.double_entry_required = args.size() == 4;

    auto id = storage_->register_form_instance(registration);
    if (id.is_err()) {
        return report_error(id.error());
    }
    std::cout << "Registered form instance " << id.value() << "\n";
    return 0;
}

auto dde_admin_app::cmd_add_field(const args_t& args) -> int {
    int64_t form_id = 0;
    int64_t item_id = 0;
    if (args.size() < 3 || args.size() > 4 || !parse_id(args[0], form_id) ||
        !parse_id(args[1], item_id)) {
        return usage_error("add-field <form-id> <item-id> <item-name> [value]");
    }

    std::optional<std::string> value;
    if (args.size() == 4) {
        value = args[3];
    }

    auto field_id = storage_->register_field(form_id, item_id, args[2], value);
    if (field_id.is_err()) {
        return report_error(field_id.error());
    }
    std::cout << "Field " << field_id.value() << " (" << args[2] << ") on form instance "
              << form_id << "\n";
    return 0;
}

// =============================================================================
// Lifecycle
// =============================================================================

auto dde_admin_app::cmd_start(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() != 2 || !parse_id(args[0], form_id)) {
        return usage_error("start <form-id> <user>");
    }

    auto result = engine_->lifecycle().start_first_entry(form_id, args[1]);
    if (result.is_err()) {
        return report_error(result.error());
    }
    std::cout << "First entry started on form instance " << form_id << "\n";
    return 0;
}

auto dde_admin_app::cmd_complete_first(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() != 2 || !parse_id(args[0], form_id)) {
        return usage_error("complete-first <form-id> <user>");
    }

    auto result = engine_->lifecycle().mark_first_entry_complete(form_id, args[1]);
    if (result.is_err()) {
        return report_error(result.error());
    }
    std::cout << "First entry complete on form instance " << form_id << "\n";
    return 0;
}

auto dde_admin_app::cmd_can_enter(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() != 2 || !parse_id(args[0], form_id)) {
        return usage_error("can-enter <form-id> <user>");
    }

    auto decision = engine_->gate().check(form_id, args[1]);
    if (decision.is_err()) {
        return report_error(decision.error());
    }

    const auto& d = decision.value();
    if (d.allowed) {
        std::cout << "Allowed: " << workflow::to_string(*d.type) << " entry\n";
        return 0;
    }
    std::cout << "Denied: " << d.reason << "\n";
    return 1;
}

auto dde_admin_app::cmd_submit_second(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() < 2 || !parse_id(args[0], form_id)) {
        return usage_error("submit-second <form-id> <user> <item-id>=<value>...");
    }

    storage::second_entry_snapshot snapshot;
    for (std::size_t i = 2; i < args.size(); ++i) {
        const auto& pair = args[i];
        auto eq = pair.find('=');
        int64_t item_id = 0;
        if (eq == std::string::npos || !parse_id(pair.substr(0, eq), item_id)) {
            std::cerr << "Error: Expected <item-id>=<value>, got: " << pair << "\n";
            return 2;
        }
        snapshot[item_id] = pair.substr(eq + 1);
    }

    auto outcome = engine_->lifecycle().submit_second_entry(form_id, args[1], snapshot);
    if (outcome.is_err()) {
        return report_error(outcome.error());
    }

    print_comparison(outcome.value().comparison);
    std::cout << "Status: " << core::to_string(outcome.value().status) << "\n";
    return 0;
}

auto dde_admin_app::cmd_compare(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.empty() || args.size() > 2 || !parse_id(args[0], form_id)) {
        return usage_error("compare <form-id> [user]");
    }

    auto result = engine_->comparison().compare(form_id,
                                                args.size() == 2 ? args[1] : "dde_admin");
    if (result.is_err()) {
        return report_error(result.error());
    }
    print_comparison(result.value());
    return 0;
}

auto dde_admin_app::cmd_finalize(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() != 2 || !parse_id(args[0], form_id)) {
        return usage_error("finalize <form-id> <user>");
    }

    auto result = engine_->lifecycle().finalize(form_id, args[1]);
    if (result.is_err()) {
        return report_error(result.error());
    }
    std::cout << "Form instance " << form_id << " reconciled\n";
    return 0;
}

// =============================================================================
// Discrepancies
// =============================================================================

auto dde_admin_app::cmd_discrepancies(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() != 1 || !parse_id(args[0], form_id)) {
        return usage_error("discrepancies <form-id>");
    }

    auto list = engine_->discrepancies().list_for_form_instance(form_id);
    if (list.is_err()) {
        return report_error(list.error());
    }

    std::cout << std::left << std::setw(6) << "ID" << std::setw(8) << "ITEM"
              << std::setw(10) << "STATUS" << std::setw(16) << "FIRST"
              << std::setw(16) << "SECOND" << "RESOLUTION\n";
    for (const auto& d : list.value()) {
        std::cout << std::left << std::setw(6) << d.discrepancy_id << std::setw(8)
                  << d.item_id << std::setw(10) << storage::to_string(d.status)
                  << std::setw(16) << display(d.first_value) << std::setw(16)
                  << display(d.second_value);
        if (d.strategy) {
            std::cout << storage::to_string(*d.strategy) << " -> "
                      << d.resolved_value.value_or("") << " by " << d.resolved_by;
        }
        std::cout << "\n";
    }
    return 0;
}

auto dde_admin_app::cmd_resolve(const args_t& args) -> int {
    static constexpr const char* usage =
        "resolve <discrepancy-id> <strategy> <user> [--value <v>] [--notes <text>]";

    int64_t discrepancy_id = 0;
    if (args.size() < 3 || !parse_id(args[0], discrepancy_id)) {
        return usage_error(usage);
    }

    auto strategy = storage::parse_resolution_strategy(args[1]);
    if (!strategy) {
        std::cerr << "Error: Unknown strategy: " << args[1] << "\n";
        return 2;
    }

    workflow::resolution_request request;
    request.discrepancy_id = discrepancy_id;
    request.strategy = *strategy;
    request.resolver_id = args[2];

    for (std::size_t i = 3; i < args.size(); ++i) {
        if (args[i] == "--value" && i + 1 < args.size()) {
            request.new_value = args[++i];
        } else if (args[i] == "--notes" && i + 1 < args.size()) {
            request.notes = args[++i];
        } else {
            return usage_error(usage);
        }
    }

    auto result = engine_->discrepancies().resolve(request);
    if (result.is_err()) {
        return report_error(result.error());
    }
    std::cout << "Discrepancy " << discrepancy_id << " resolved as " << args[1] << "\n";
    return 0;
}

// =============================================================================
// Views
// =============================================================================

auto dde_admin_app::cmd_status(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() != 1 || !parse_id(args[0], form_id)) {
        return usage_error("status <form-id>");
    }

    auto status = engine_->lifecycle().get_status(form_id);
    if (status.is_err()) {
        return report_error(status.error());
    }

    const auto& s = status.value();
    std::cout << "Form instance:     " << s.form_instance_id << "\n"
              << "Status:            " << core::to_string(s.status) << "\n"
              << "Double entry:      " << (s.double_entry_required ? "required" : "not required") << "\n"
              << "First entry:       " << workflow::to_string(s.first_entry) << " "
              << display(s.first_entry_by) << " " << display(s.first_entry_at) << "\n"
              << "Second entry:      " << workflow::to_string(s.second_entry) << " "
              << display(s.second_entry_by) << " " << display(s.second_entry_at) << "\n"
              << "Comparison:        " << workflow::to_string(s.comparison) << "\n"
              << "Items:             " << s.total_items << "\n"
              << "Open discrepancies:     " << s.open_discrepancies << "\n"
              << "Resolved discrepancies: " << s.resolved_discrepancies << "\n"
              << "Complete:          " << (s.complete ? "yes" : "no") << " "
              << display(s.completed_at) << "\n";
    return 0;
}

auto dde_admin_app::cmd_audit(const args_t& args) -> int {
    int64_t form_id = 0;
    if (args.size() != 1 || !parse_id(args[0], form_id)) {
        return usage_error("audit <form-id>");
    }

    auto trail = storage_->audit_trail(form_id);
    if (trail.is_err()) {
        return report_error(trail.error());
    }

    for (const auto& entry : trail.value()) {
        std::cout << compat::to_timestamp_string(entry.timestamp) << "  "
                  << entry.user_id << "  " << entry.entity_name << "  "
                  << display(entry.old_value) << " -> " << display(entry.new_value)
                  << "  (" << entry.reason << ")\n";
    }
    return 0;
}

auto dde_admin_app::cmd_dashboard(const args_t& args) -> int {
    if (args.size() > 1) {
        return usage_error("dashboard [site]");
    }

    std::optional<std::string> site;
    if (!args.empty()) {
        site = args[0];
    }

    auto overview = engine_->dashboard().overview(site);
    if (overview.is_err()) {
        return report_error(overview.error());
    }
    const auto& view = overview.value();

    std::cout << "Pending second entry (" << view.pending_second_entry.size() << ")\n";
    for (const auto& row : view.pending_second_entry) {
        std::cout << "  #" << row.form_instance_id << " " << row.subject_label << " "
                  << row.form_name << "/" << row.event_name << " first by "
                  << row.first_entry_by << ", waiting " << row.days_waiting << " day(s)\n";
    }

    std::cout << "Pending resolution (" << view.pending_resolution.size() << ")\n";
    for (const auto& row : view.pending_resolution) {
        std::cout << "  #" << row.form_instance_id << " " << row.subject_label << " "
                  << row.form_name << "/" << row.event_name << " "
                  << row.open_discrepancies << " open, waiting " << row.days_waiting
                  << " day(s)\n";
    }

    const auto& stats = view.statistics;
    std::cout << "Statistics: total " << stats.total << ", pending " << stats.pending
              << ", discrepancies " << stats.discrepancies << ", complete "
              << stats.complete << "\n";
    return 0;
}

void dde_admin_app::print_comparison(const workflow::comparison_result& result) {
    for (const auto& field : result.fields) {
        std::cout << "  " << (field.matches ? "=" : "!") << " " << std::left
                  << std::setw(12) << field.item_name << std::setw(16)
                  << display(field.first_value) << display(field.second_value);
        if (field.discrepancy_id) {
            std::cout << "  [discrepancy " << *field.discrepancy_id;
            if (field.discrepancy_status) {
                std::cout << " " << storage::to_string(*field.discrepancy_status);
            }
            std::cout << "]";
        }
        std::cout << "\n";
    }
    std::cout << "Total " << result.total << ", matched " << result.matched
              << ", mismatched " << result.mismatched << ", new discrepancies "
              << result.created << "\n";
}

}  // namespace dde::example
