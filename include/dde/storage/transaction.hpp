/**
 * @file transaction.hpp
 * @brief Scoped transaction helper over dde_storage_interface
 *
 * Runs a callable between begin_transaction() and commit(). The transaction
 * is rolled back when the callable returns an error or throws, so every
 * exit path leaves the store either fully updated or untouched.
 */

#pragma once

#include <dde/core/result.hpp>
#include <dde/integration/logger_adapter.hpp>
#include <dde/storage/dde_storage_interface.hpp>

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace dde::storage {

namespace detail {

inline void rollback_or_log(dde_storage_interface& storage) {
    auto result = storage.rollback();
    if (result.is_err()) {
        integration::logger_adapter::error("Transaction rollback failed: {}",
                                           result.error().message);
    }
}

}  // namespace detail

/**
 * @brief Execute a function within a storage transaction
 *
 * @tparam Func Callable returning Result<T> or VoidResult
 * @param storage Storage whose transaction brackets the call
 * @param func Work to perform
 * @return The callable's result, or the begin/commit/exception error
 */
template <typename Func>
[[nodiscard]] auto in_transaction(dde_storage_interface& storage, Func&& func)
    -> std::invoke_result_t<Func> {
    using ReturnType = std::invoke_result_t<Func>;

    auto begin_result = storage.begin_transaction();
    if (begin_result.is_err()) {
        if constexpr (std::is_same_v<ReturnType, VoidResult>) {
            return begin_result;
        } else {
            return ReturnType(begin_result.error());
        }
    }

    try {
        auto result = std::forward<Func>(func)();

        if (result.is_err()) {
            detail::rollback_or_log(storage);
            return result;
        }

        auto commit_result = storage.commit();
        if (commit_result.is_err()) {
            detail::rollback_or_log(storage);
            if constexpr (std::is_same_v<ReturnType, VoidResult>) {
                return commit_result;
            } else {
                return ReturnType(commit_result.error());
            }
        }

        return result;
    } catch (const std::exception& e) {
        detail::rollback_or_log(storage);

        error_info info{error_codes::database_transaction_error,
                        std::string("Transaction failed: ") + e.what(), "dde"};
        if constexpr (std::is_same_v<ReturnType, VoidResult>) {
            return VoidResult(info);
        } else {
            return ReturnType(info);
        }
    }
}

}  // namespace dde::storage
