#pragma once

#include "entity/EntityCache.hpp"
#include "upstream/Backoff.hpp"
#include "upstream/CommandSink.hpp"
#include "upstream/UpstreamSession.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace HC::Upstream {

struct SyncClientOptions {
    UpstreamOptions           upstream;
    BackoffPolicy             backoff;
    std::chrono::milliseconds heartbeat_interval{std::chrono::milliseconds{15000}};
    std::chrono::milliseconds idle_timeout{std::chrono::milliseconds{45000}};
    std::chrono::milliseconds receive_poll{std::chrono::milliseconds{50}};
};

struct SyncStats {
    std::uint64_t connection_attempts{0};
    std::uint64_t subscriptions{0};
    std::uint64_t events_applied{0};
    std::uint64_t malformed_events{0};
    std::uint64_t commands_sent{0};
    std::uint64_t commands_rejected{0};
    std::string   last_error;
};

/**
 * Keeps the entity cache in step with the source.
 *
 * A single background thread owns the session: it authenticates, subscribes
 * to state changes, applies the full state dump and every later event, and
 * reconnects with exponential backoff. It is the only writer to the cache.
 *
 * Other threads reach the source through callService(); calls are queued to
 * the sync thread and answered through a future once the source replies.
 */
class SyncClient final : public CommandSink {
public:
    SyncClient(EntityCache& cache, std::shared_ptr<UpstreamSessionFactory> factory, SyncClientOptions options);
    ~SyncClient() override;

    SyncClient(SyncClient const&)            = delete;
    SyncClient& operator=(SyncClient const&) = delete;

    void start();
    void stop();
    [[nodiscard]] auto running() const -> bool { return running_.load(); }

    [[nodiscard]] auto connectionState() const -> ConnectionState override;
    auto callService(ServiceCall const& call, std::chrono::milliseconds timeout) -> Expected<void> override;

    [[nodiscard]] auto stats() const -> SyncStats;

    // Blocks until the connection state equals `target` or the timeout passes.
    auto waitForState(ConnectionState target, std::chrono::milliseconds timeout) const -> bool;

private:
    struct PendingCommand {
        ServiceCall                  call;
        std::promise<Expected<void>> promise;
    };
    using PendingPtr = std::shared_ptr<PendingCommand>;

    void run();
    auto runSession(UpstreamSession& session) -> Error;
    auto authenticate(UpstreamSession& session) -> Expected<void>;
    auto receiveWithin(UpstreamSession& session, std::chrono::milliseconds timeout) -> Expected<InboundMessage>;
    auto flushOutbound(UpstreamSession& session) -> Expected<std::size_t>;
    void applyEvent(EventMessage const& event);
    auto applyDump(ResultMessage const& result) -> Expected<void>;
    void completeCommand(ResultMessage const& result);
    void setState(ConnectionState state);
    void handleDisconnect(Error const& reason);
    void sleepFor(std::chrono::milliseconds delay);

    EntityCache&                            cache_;
    std::shared_ptr<UpstreamSessionFactory> factory_;
    SyncClientOptions                       options_;
    Backoff                                 backoff_;

    mutable std::mutex              mutex_;
    mutable std::condition_variable state_cv_;
    std::condition_variable         wake_cv_;
    std::atomic<ConnectionState>    state_{ConnectionState::Disconnected};
    std::deque<PendingPtr>          outbound_;
    std::map<std::uint64_t, PendingPtr> in_flight_;
    std::uint64_t                   next_id_{1};
    SyncStats                       stats_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread       worker_;
};

} // namespace HC::Upstream
