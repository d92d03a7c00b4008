/**
 * @file entity_lock_manager.hpp
 * @brief Per-entity exclusive locks for DDE workflow operations
 *
 * Every mutating DDE operation follows "load state, decide, mutate". The
 * lock manager makes that sequence atomic per entity: a caller holding the
 * lock for form_instance:<id> is the only one allowed to transition that
 * form instance, and a caller holding discrepancy:<id> is the only one
 * allowed to resolve that discrepancy.
 *
 * Lock order is always form instance before discrepancy.
 *
 * @example
 * @code
 * entity_lock_manager locks;
 *
 * auto token = locks.lock(entity_lock_manager::form_instance_key(42), "user-7",
 *                         "submit second entry");
 * if (token.is_ok()) {
 *     scoped_entity_lock guard(locks, token.value());
 *     // load, decide, mutate
 * }
 * @endcode
 */

#pragma once

#include <dde/core/result.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dde::workflow {

// =============================================================================
// Lock Token and Information
// =============================================================================

/**
 * @brief Proof of lock ownership returned by lock()
 */
struct lock_token {
    /// Unique token ID
    std::string token_id;

    /// Locked entity key (e.g. "form_instance:42")
    std::string key;

    /// When the lock was acquired
    std::chrono::system_clock::time_point acquired_at;
};

/**
 * @brief Information about a held lock
 */
struct lock_info {
    std::string key;
    std::string holder;
    std::string reason;
    std::string token_id;
    std::chrono::system_clock::time_point acquired_at;

    [[nodiscard]] auto duration() const -> std::chrono::milliseconds {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - acquired_at);
    }
};

// =============================================================================
// Configuration and Statistics
// =============================================================================

struct entity_lock_manager_config {
    /// Maximum time to wait for a lock held by someone else
    std::chrono::milliseconds acquire_wait_timeout{5000};
};

struct lock_manager_stats {
    /// Number of currently held locks
    std::size_t active_locks{0};

    /// Total locks acquired
    std::size_t total_acquisitions{0};

    /// Total locks released
    std::size_t total_releases{0};

    /// Lock acquisitions that timed out
    std::size_t timeout_count{0};

    /// Acquisitions that had to wait for another holder
    std::size_t contention_count{0};

    /// Maximum lock duration observed
    std::chrono::milliseconds max_lock_duration{0};
};

// =============================================================================
// Entity Lock Manager
// =============================================================================

/**
 * @brief Exclusive lock table keyed by entity
 *
 * Locks are not reentrant: acquiring a key already held by the calling
 * thread waits for the full timeout and fails.
 *
 * Thread Safety: All methods are thread-safe.
 */
class entity_lock_manager {
public:
    entity_lock_manager();

    explicit entity_lock_manager(const entity_lock_manager_config& config);

    ~entity_lock_manager() = default;

    entity_lock_manager(const entity_lock_manager&) = delete;
    entity_lock_manager& operator=(const entity_lock_manager&) = delete;
    entity_lock_manager(entity_lock_manager&&) = delete;
    entity_lock_manager& operator=(entity_lock_manager&&) = delete;

    // =========================================================================
    // Keys
    // =========================================================================

    [[nodiscard]] static auto form_instance_key(int64_t form_instance_id)
        -> std::string;

    [[nodiscard]] static auto discrepancy_key(int64_t discrepancy_id)
        -> std::string;

    // =========================================================================
    // Lock Acquisition
    // =========================================================================

    /**
     * @brief Acquire an exclusive lock, waiting up to acquire_wait_timeout
     *
     * @param key Entity key
     * @param holder Who is acquiring the lock
     * @param reason Why the lock is needed
     * @return Token on success, error_codes::lock_timeout when the wait expires
     */
    [[nodiscard]] auto lock(const std::string& key, const std::string& holder,
                            const std::string& reason) -> Result<lock_token>;

    /**
     * @brief Acquire an exclusive lock with an explicit wait
     *
     * A zero wait fails immediately when the key is held.
     */
    [[nodiscard]] auto lock(const std::string& key, const std::string& holder,
                            const std::string& reason,
                            std::chrono::milliseconds wait) -> Result<lock_token>;

    /**
     * @brief Release a lock
     * @return Error if the token is unknown
     */
    [[nodiscard]] auto unlock(const lock_token& token) -> VoidResult;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] auto is_locked(const std::string& key) const -> bool;

    [[nodiscard]] auto get_lock_info(const std::string& key) const
        -> std::optional<lock_info>;

    [[nodiscard]] auto get_all_locks() const -> std::vector<lock_info>;

    [[nodiscard]] auto get_stats() const -> lock_manager_stats;

    void reset_stats();

    [[nodiscard]] auto get_config() const -> const entity_lock_manager_config& {
        return config_;
    }

private:
    [[nodiscard]] auto generate_token_id() const -> std::string;

    entity_lock_manager_config config_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::map<std::string, lock_info> locks_;

    lock_manager_stats stats_;

    mutable std::atomic<uint64_t> next_token_id_{1};
};

// =============================================================================
// RAII Guard
// =============================================================================

/**
 * @brief Releases a lock token when it goes out of scope
 */
class scoped_entity_lock {
public:
    scoped_entity_lock(entity_lock_manager& manager, lock_token token);
    ~scoped_entity_lock();

    scoped_entity_lock(const scoped_entity_lock&) = delete;
    scoped_entity_lock& operator=(const scoped_entity_lock&) = delete;

    scoped_entity_lock(scoped_entity_lock&& other) noexcept;
    scoped_entity_lock& operator=(scoped_entity_lock&& other) noexcept;

    /// Release early; later calls and the destructor do nothing
    void release();

    [[nodiscard]] auto token() const -> const lock_token& { return token_; }

private:
    entity_lock_manager* manager_;
    lock_token token_;
    bool owns_{true};
};

}  // namespace dde::workflow
