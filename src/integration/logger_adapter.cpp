/**
 * @file logger_adapter.cpp
 * @brief Implementation of the DDE logging adapter
 */

#include <dde/integration/logger_adapter.hpp>

#include <dde/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <string_view>
#include <utility>

namespace dde::integration {

namespace {

constexpr std::array<std::pair<std::string_view, log_level>, 7> level_names{{
    {"trace", log_level::trace},
    {"debug", log_level::debug},
    {"info", log_level::info},
    {"warn", log_level::warn},
    {"error", log_level::error},
    {"fatal", log_level::fatal},
    {"off", log_level::off},
}};

auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::fatal;
        default: return kcenon::logger::log_level::off;
    }
}

void append_json_string(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

/**
 * @brief Append-only JSON-lines file for security events
 *
 * The file stays open between events; every line is flushed as written.
 */
class security_trail {
public:
    auto open(const std::filesystem::path& path) -> bool {
        std::lock_guard lock(mutex_);
        stream_.open(path, std::ios::out | std::ios::app);
        return stream_.is_open();
    }

    void close() {
        std::lock_guard lock(mutex_);
        if (stream_.is_open()) {
            stream_.close();
        }
    }

    void write(const security_event& event) {
        std::string line;
        line.reserve(128 + event.description.size());
        line += "{\"timestamp\":";
        append_json_string(
            line, compat::to_timestamp_string(std::chrono::system_clock::now()) + "Z");
        line += ",\"event_type\":";
        append_json_string(line, to_string(event.type));
        line += ",\"user_id\":";
        append_json_string(line, event.user_id);
        line += ",\"description\":";
        append_json_string(line, event.description);
        line += "}\n";

        std::lock_guard lock(mutex_);
        if (!stream_.is_open()) {
            return;
        }
        stream_ << line;
        stream_.flush();
    }

private:
    std::mutex mutex_;
    std::ofstream stream_;
};

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_security_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                           config.buffer_size);
        logger_->set_min_level(to_logger_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "dde.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        logger_->start();

        security_enabled_ =
            config.enable_security_log &&
            trail_.open(config.log_directory / "security_audit.json");

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        trail_.close();
        security_enabled_ = false;
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!is_level_enabled(level)) {
            return;
        }
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->log(to_logger_level(level), message);
        }
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void record(const security_event& event) {
        if (security_enabled_) {
            trail_.write(event);
        }
    }

private:
    std::mutex mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> security_enabled_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    security_trail trail_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Free Functions
// =============================================================================

auto parse_log_level(const std::string& name, log_level& level) -> bool {
    for (const auto& [key, value] : level_names) {
        if (key == name) {
            level = value;
            return true;
        }
    }
    return false;
}

auto to_string(security_event_type type) -> std::string {
    switch (type) {
        case security_event_type::entry_denied: return "ENTRY_DENIED";
        case security_event_type::same_entrant_rejected: return "SAME_ENTRANT_REJECTED";
        case security_event_type::lock_timeout: return "LOCK_TIMEOUT";
        case security_event_type::invalid_request: return "INVALID_REQUEST";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// Facade
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& user_id) {
    if (!pimpl_->is_initialized()) {
        return;
    }

    warn("Security event [{}]: {} (user: {})", to_string(type), description,
         user_id.empty() ? "unknown" : user_id);
    pimpl_->record({type, description, user_id});
}

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

}  // namespace dde::integration
