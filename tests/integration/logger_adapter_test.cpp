/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <dde/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace dde::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "dde_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;
        config.enable_file = true;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Logging before initialization is a no-op") {
        REQUIRE_FALSE(logger_adapter::is_initialized());
        logger_adapter::info("Form {} reconciled", 42);
        logger_adapter::log_security_event(security_event_type::entry_denied,
                                           "ignored", "alice");
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Level Tests
// =============================================================================

TEST_CASE("logger_adapter level filtering", "[logger_adapter][level]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_security_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    logger_adapter::trace("Trace message: {}", 1);
    logger_adapter::debug("Debug message: {}", 2);
    logger_adapter::info("Info message: {}", 3);
    logger_adapter::warn("Warn message: {}", 4);
    logger_adapter::error("Error message: {}", 5);
    logger_adapter::flush();

    logger_adapter::set_min_level(log_level::warn);
    REQUIRE(logger_adapter::get_min_level() == log_level::warn);
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
    REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
    REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
}

TEST_CASE("parse_log_level", "[logger_adapter][level]") {
    log_level level = log_level::info;

    REQUIRE(parse_log_level("debug", level));
    CHECK(level == log_level::debug);
    REQUIRE(parse_log_level("warn", level));
    CHECK(level == log_level::warn);
    REQUIRE(parse_log_level("off", level));
    CHECK(level == log_level::off);

    CHECK_FALSE(parse_log_level("verbose", level));
    CHECK(level == log_level::off);
}

// =============================================================================
// Security Event Tests
// =============================================================================

TEST_CASE("logger_adapter security event logging", "[logger_adapter][security]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_security_log = true;

    logger_test_fixture fixture(config);
    auto security_path = temp_dir / "security_audit.json";

    SECTION("Same entrant rejection") {
        logger_adapter::log_security_event(
            security_event_type::same_entrant_rejected,
            "Form instance 7: Different user required for second entry", "alice");

        auto content = read_file_contents(security_path);
        CHECK(content.find("SAME_ENTRANT_REJECTED") != std::string::npos);
        CHECK(content.find("alice") != std::string::npos);
        CHECK(content.find("Form instance 7") != std::string::npos);
    }

    SECTION("Lock timeout") {
        logger_adapter::log_security_event(security_event_type::lock_timeout,
                                           "Timed out waiting for form_instance:1",
                                           "bob");

        auto content = read_file_contents(security_path);
        CHECK(content.find("LOCK_TIMEOUT") != std::string::npos);
    }

    SECTION("Values are JSON escaped") {
        logger_adapter::log_security_event(security_event_type::entry_denied,
                                           "quote \" and backslash \\", "carol");

        auto content = read_file_contents(security_path);
        CHECK(content.find("quote \\\" and backslash \\\\") != std::string::npos);
    }
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();

    logger_config config;
    config.log_directory = temp_dir;
    config.min_level = log_level::debug;
    config.enable_console = false;
    config.enable_file = true;
    config.max_file_size_mb = 50;
    config.max_files = 5;

    logger_test_fixture fixture(config);

    const auto& retrieved = logger_adapter::get_config();
    CHECK(retrieved.min_level == log_level::debug);
    CHECK(retrieved.enable_file);
    CHECK(retrieved.max_file_size_mb == 50);
    CHECK(retrieved.max_files == 5);
}

// =============================================================================
// Thread Safety
// =============================================================================

TEST_CASE("logger_adapter thread safety", "[logger_adapter][thread]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_security_log = true;

    logger_test_fixture fixture(config);

    constexpr int num_threads = 4;
    constexpr int per_thread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < per_thread; ++i) {
                logger_adapter::info("Thread {} message {}", t, i);
                if (i % 10 == 0) {
                    logger_adapter::log_security_event(
                        security_event_type::entry_denied, "denied",
                        "user-" + std::to_string(t));
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger_adapter::flush();

    auto content = read_file_contents(temp_dir / "security_audit.json");
    std::size_t lines = 0;
    for (char c : content) {
        if (c == '\n') ++lines;
    }
    CHECK(lines == num_threads * (per_thread / 10));
}
