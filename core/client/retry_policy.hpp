#pragma once

#include <utility>
#include <vector>

namespace qode {
namespace client {

struct RetryPolicyConfig {
    int max_attempts = 100;       // Connection attempts before giving up
    int delay_ms = 100;           // Delay between attempts
    std::vector<int> backoff_ms;  // Optional per-attempt schedule; last entry repeats
};

// RetryPolicy bounds connection attempts to a worker that is still starting.
// Once max_attempts attempts have been recorded the policy is exhausted and
// stays so until reset().
class RetryPolicy {
public:
    explicit RetryPolicy(RetryPolicyConfig config = RetryPolicyConfig()) : config_(std::move(config)) {}

    // Count a new attempt; returns its 1-based number
    int record_attempt();

    // True if another attempt is allowed after a refusal
    bool should_retry() const;

    bool is_exhausted() const { return attempt_count_ >= config_.max_attempts; }

    // Delay before the next attempt
    int next_delay_ms() const;

    int attempt_count() const { return attempt_count_; }
    int max_attempts() const { return config_.max_attempts; }

    void reset() { attempt_count_ = 0; }

    const RetryPolicyConfig &config() const { return config_; }

private:
    RetryPolicyConfig config_;
    int attempt_count_ = 0;
};

}  // namespace client
}  // namespace qode
