#include <dedupstore/retry.hpp>

#include <spdlog/spdlog.h>

#include <thread>

namespace dedupstore::detail {

bool prepare_retry(const retry_policy& policy, u32 attempt, const contention_error& e) {
    if (policy.max_attempts && attempt >= *policy.max_attempts) {
        spdlog::warn("Giving up after {} attempts: {}", attempt, e.what());
        return false;
    }

    spdlog::debug("Store is busy, retrying in {} ms (attempt {}): {}", policy.delay.count(),
                  attempt, e.what());
    if (policy.delay.count() > 0)
        std::this_thread::sleep_for(policy.delay);
    return true;
}

} // namespace dedupstore::detail
