#include "upstream/Backoff.hpp"

#include <algorithm>

namespace HC::Upstream {

Backoff::Backoff(BackoffPolicy policy)
    : policy_(policy) {
    if (policy_.initial.count() <= 0) {
        policy_.initial = std::chrono::milliseconds{1};
    }
    policy_.maximum = std::max(policy_.maximum, policy_.initial);
}

auto Backoff::peekDelay() const -> std::chrono::milliseconds {
    auto delay = policy_.initial;
    for (std::uint32_t i = 0; i < attempts_ && delay < policy_.maximum; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy_.maximum);
}

auto Backoff::nextDelay() -> std::chrono::milliseconds {
    auto delay = peekDelay();
    if (delay < policy_.maximum) {
        ++attempts_;
    }
    return delay;
}

void Backoff::onSubscribed(Clock::time_point now) {
    subscribed_since_ = now;
}

auto Backoff::onHeartbeat(Clock::time_point now) -> bool {
    if (!subscribed_since_ || now - *subscribed_since_ < policy_.stable) {
        return false;
    }
    attempts_ = 0;
    return true;
}

void Backoff::onDisconnected(Clock::time_point now) {
    onHeartbeat(now);
    subscribed_since_.reset();
}

} // namespace HC::Upstream
