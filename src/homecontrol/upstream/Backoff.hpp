#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace HC::Upstream {

struct BackoffPolicy {
    std::chrono::milliseconds initial{std::chrono::milliseconds{500}};
    std::chrono::milliseconds maximum{std::chrono::milliseconds{30000}};
    // How long a subscription must hold before the delay drops back to `initial`.
    std::chrono::milliseconds stable{std::chrono::milliseconds{10000}};
};

/**
 * Exponential reconnect delay: min(maximum, initial * 2^attempts).
 *
 * Reaching a subscription alone does not reset the sequence; a connection that
 * flaps right after subscribing keeps backing off.
 */
class Backoff {
public:
    using Clock = std::chrono::steady_clock;

    explicit Backoff(BackoffPolicy policy = {});

    // Delay before the next attempt; advances the attempt counter.
    auto nextDelay() -> std::chrono::milliseconds;
    [[nodiscard]] auto peekDelay() const -> std::chrono::milliseconds;

    void onSubscribed(Clock::time_point now);
    // Resets the sequence if the subscription has been stable long enough.
    auto onHeartbeat(Clock::time_point now) -> bool;
    void onDisconnected(Clock::time_point now);

    [[nodiscard]] auto attempts() const -> std::uint32_t { return attempts_; }
    [[nodiscard]] auto policy() const -> BackoffPolicy const& { return policy_; }

private:
    BackoffPolicy                    policy_;
    std::uint32_t                    attempts_{0};
    std::optional<Clock::time_point> subscribed_since_;
};

} // namespace HC::Upstream
