#pragma once
#include <chrono>
#include <functional>

namespace mcphost {

struct BackoffPolicy {
    int max_attempts = 10;
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{5000};
};

/// Capped exponential backoff: attempt n waits min(base * 2^(n-1), max).
class ExponentialBackoff {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit ExponentialBackoff(BackoffPolicy policy = {}, Sleeper sleeper = nullptr);

    /// Delay before the given 1-based attempt.
    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const;

    /// Check `ready` immediately, then after each backoff delay, until it
    /// returns true, attempts run out, or `timeout` has elapsed.
    bool poll(const std::function<bool()>& ready, std::chrono::milliseconds timeout) const;

    [[nodiscard]] const BackoffPolicy& policy() const noexcept { return policy_; }

private:
    BackoffPolicy policy_;
    Sleeper sleeper_;
};

} // namespace mcphost
