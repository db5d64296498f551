#include "mcphost/backoff.hpp"
#include <algorithm>
#include <thread>

namespace mcphost {

ExponentialBackoff::ExponentialBackoff(BackoffPolicy policy, Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds ExponentialBackoff::delay_for(int attempt) const {
    if (attempt < 1) attempt = 1;
    auto delay = policy_.base_delay;
    for (int i = 1; i < attempt && delay < policy_.max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy_.max_delay);
}

bool ExponentialBackoff::poll(const std::function<bool()>& ready,
                              std::chrono::milliseconds timeout) const {
    if (ready()) return true;

    auto remaining = timeout;
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (remaining.count() <= 0) break;
        auto delay = std::min(delay_for(attempt), remaining);
        sleeper_(delay);
        remaining -= delay;
        if (ready()) return true;
    }
    return false;
}

} // namespace mcphost
