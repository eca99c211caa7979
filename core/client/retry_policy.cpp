#include "retry_policy.hpp"

namespace qode {
namespace client {

int RetryPolicy::record_attempt() { return ++attempt_count_; }

bool RetryPolicy::should_retry() const { return attempt_count_ < config_.max_attempts; }

int RetryPolicy::next_delay_ms() const {
    if (config_.backoff_ms.empty()) {
        return config_.delay_ms;
    }

    int index = attempt_count_ > 0 ? attempt_count_ - 1 : 0;
    if (index >= static_cast<int>(config_.backoff_ms.size())) {
        index = static_cast<int>(config_.backoff_ms.size()) - 1;
    }
    return config_.backoff_ms[index];
}

}  // namespace client
}  // namespace qode
