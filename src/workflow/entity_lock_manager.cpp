/**
 * @file entity_lock_manager.cpp
 * @brief Implementation of per-entity exclusive locks
 */

#include <dde/workflow/entity_lock_manager.hpp>

#include <dde/compat/format.hpp>
#include <dde/integration/logger_adapter.hpp>

#include <iomanip>
#include <sstream>

namespace dde::workflow {

using integration::logger_adapter;
using integration::security_event_type;

// =============================================================================
// Construction
// =============================================================================

entity_lock_manager::entity_lock_manager()
    : entity_lock_manager(entity_lock_manager_config{}) {}

entity_lock_manager::entity_lock_manager(const entity_lock_manager_config& config)
    : config_(config) {}

// =============================================================================
// Keys
// =============================================================================

auto entity_lock_manager::form_instance_key(int64_t form_instance_id)
    -> std::string {
    return "form_instance:" + std::to_string(form_instance_id);
}

auto entity_lock_manager::discrepancy_key(int64_t discrepancy_id) -> std::string {
    return "discrepancy:" + std::to_string(discrepancy_id);
}

// =============================================================================
// Lock Acquisition
// =============================================================================

auto entity_lock_manager::lock(const std::string& key, const std::string& holder,
                               const std::string& reason) -> Result<lock_token> {
    return lock(key, holder, reason, config_.acquire_wait_timeout);
}

auto entity_lock_manager::lock(const std::string& key, const std::string& holder,
                               const std::string& reason,
                               std::chrono::milliseconds wait)
    -> Result<lock_token> {
    std::unique_lock lock{mutex_};

    auto it = locks_.find(key);
    if (it != locks_.end()) {
        ++stats_.contention_count;
        logger_adapter::debug("Waiting for {} (held by {} for {})", key,
                              it->second.holder, it->second.reason);

        const auto deadline = std::chrono::steady_clock::now() + wait;
        bool acquired = released_.wait_until(lock, deadline, [&] {
            return locks_.find(key) == locks_.end();
        });

        if (!acquired) {
            ++stats_.timeout_count;
            const auto& existing = locks_.at(key);
            auto message = compat::format(
                "Timed out after {} ms waiting for {} (held by {}: {})",
                wait.count(), key, existing.holder, existing.reason);
            lock.unlock();

            logger_adapter::log_security_event(security_event_type::lock_timeout,
                                               message, holder);
            return dde_error<lock_token>(error_codes::lock_timeout, message);
        }
    }

    lock_info info;
    info.key = key;
    info.holder = holder;
    info.reason = reason;
    info.token_id = generate_token_id();
    info.acquired_at = std::chrono::system_clock::now();

    lock_token token;
    token.token_id = info.token_id;
    token.key = key;
    token.acquired_at = info.acquired_at;

    locks_[key] = std::move(info);
    ++stats_.total_acquisitions;
    stats_.active_locks = locks_.size();

    return token;
}

auto entity_lock_manager::unlock(const lock_token& token) -> VoidResult {
    {
        std::lock_guard lock{mutex_};

        auto it = locks_.find(token.key);
        if (it == locks_.end()) {
            return dde_void_error(error_codes::lock_not_found,
                                  "Lock not found: " + token.key);
        }
        if (it->second.token_id != token.token_id) {
            return dde_void_error(error_codes::lock_invalid_token,
                                  "Invalid token for lock: " + token.key);
        }

        auto duration = it->second.duration();
        if (duration > stats_.max_lock_duration) {
            stats_.max_lock_duration = duration;
        }

        locks_.erase(it);
        ++stats_.total_releases;
        stats_.active_locks = locks_.size();
    }

    released_.notify_all();
    return ok();
}

// =============================================================================
// Queries
// =============================================================================

auto entity_lock_manager::is_locked(const std::string& key) const -> bool {
    std::lock_guard lock{mutex_};
    return locks_.find(key) != locks_.end();
}

auto entity_lock_manager::get_lock_info(const std::string& key) const
    -> std::optional<lock_info> {
    std::lock_guard lock{mutex_};
    auto it = locks_.find(key);
    if (it == locks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto entity_lock_manager::get_all_locks() const -> std::vector<lock_info> {
    std::lock_guard lock{mutex_};
    std::vector<lock_info> result;
    result.reserve(locks_.size());
    for (const auto& [key, info] : locks_) {
        result.push_back(info);
    }
    return result;
}

auto entity_lock_manager::get_stats() const -> lock_manager_stats {
    std::lock_guard lock{mutex_};
    return stats_;
}

void entity_lock_manager::reset_stats() {
    std::lock_guard lock{mutex_};
    stats_ = lock_manager_stats{};
    stats_.active_locks = locks_.size();
}

// =============================================================================
// Internal Methods
// =============================================================================

auto entity_lock_manager::generate_token_id() const -> std::string {
    const auto id = next_token_id_.fetch_add(1);
    const auto time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << "lock_" << std::hex << std::setfill('0')
        << std::setw(12) << time_ms
        << "_" << std::setw(8) << id;

    return oss.str();
}

// =============================================================================
// scoped_entity_lock
// =============================================================================

scoped_entity_lock::scoped_entity_lock(entity_lock_manager& manager,
                                       lock_token token)
    : manager_(&manager), token_(std::move(token)) {}

scoped_entity_lock::~scoped_entity_lock() { release(); }

scoped_entity_lock::scoped_entity_lock(scoped_entity_lock&& other) noexcept
    : manager_(other.manager_),
      token_(std::move(other.token_)),
      owns_(other.owns_) {
    other.owns_ = false;
}

scoped_entity_lock& scoped_entity_lock::operator=(
    scoped_entity_lock&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        token_ = std::move(other.token_);
        owns_ = other.owns_;
        other.owns_ = false;
    }
    return *this;
}

void scoped_entity_lock::release() {
    if (!owns_) {
        return;
    }
    owns_ = false;

    auto result = manager_->unlock(token_);
    if (result.is_err()) {
        logger_adapter::error("Failed to release {}: {}", token_.key,
                              result.error().message);
    }
}

}  // namespace dde::workflow
