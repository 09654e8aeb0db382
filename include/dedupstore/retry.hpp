#ifndef DEDUPSTORE_RETRY_HPP
#define DEDUPSTORE_RETRY_HPP

#include <dedupstore/defs.hpp>
#include <dedupstore/exception.hpp>
#include <dedupstore/store.hpp>

#include <chrono>
#include <optional>
#include <type_traits>
#include <utility>

namespace dedupstore {

/// Controls how often and how fast failed transactions are repeated.
struct retry_policy {
    /// Time to wait before the next attempt.
    std::chrono::milliseconds delay{100};

    /// Maximum number of attempts (including the first one).
    /// An empty optional means "retry forever".
    std::optional<u32> max_attempts;
};

namespace detail {

// Returns true if another attempt is allowed after `attempt` attempts have failed.
// Logs the failure and waits for the configured delay.
bool prepare_retry(const retry_policy& policy, u32 attempt, const contention_error& e);

} // namespace detail

/**
 * Runs `fn(tx)` in a new transaction on `s` and commits the transaction afterwards
 * (unless `fn` has already committed or rolled back).
 *
 * When the store reports contention, either while `fn` is running or during the commit,
 * all changes are thrown away and the whole operation is repeated in a fresh transaction
 * according to the retry policy. `fn` must therefore not have side effects outside of
 * the transaction that it cannot repeat.
 *
 * Exceptions other than \ref contention_error are propagated immediately.
 * When the number of attempts is exhausted, the last \ref contention_error is rethrown.
 *
 * Returns the value returned by the last (successful) invocation of `fn`.
 */
template<typename Func>
auto run_transaction(store& s, const retry_policy& policy, Func&& fn)
    -> std::invoke_result_t<Func&, transaction&> {
    using result_type = std::invoke_result_t<Func&, transaction&>;

    for (u32 attempt = 1;; ++attempt) {
        try {
            transaction tx(s);
            if constexpr (std::is_void_v<result_type>) {
                fn(tx);
                if (tx.active())
                    tx.commit();
                return;
            } else {
                result_type result = fn(tx);
                if (tx.active())
                    tx.commit();
                return result;
            }
        } catch (const contention_error& e) {
            if (!detail::prepare_retry(policy, attempt, e))
                throw;
        }
    }
}

} // namespace dedupstore

#endif // DEDUPSTORE_RETRY_HPP
