#pragma once

#include "core/TimeUtils.hpp"
#include "upstream/UpstreamProtocol.hpp"
#include "upstream/UpstreamSession.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace HC::Upstream::Loopback {

/**
 * In-process stand-in for the source.
 *
 * Speaks the same JSON messages as the real hub over in-memory queues, so a
 * SyncClient wired to makeFactory(hub) runs its full protocol path. Tests
 * drive entity changes and failure modes through the public setters.
 */
class Hub : public std::enable_shared_from_this<Hub> {
public:
    struct Connection;

    explicit Hub(std::string access_token = "loopback-token");

    // Stores the entity and, when `notify` is set, emits state_changed to subscribed connections.
    void setEntity(EntityId const& id, std::string state, nlohmann::json attributes = nlohmann::json::object(),
                   bool notify = true);
    void removeEntity(EntityId const& id);
    [[nodiscard]] auto entityState(EntityId const& id) const -> std::optional<std::string>;

    // Delivers raw text as-is to every subscribed connection.
    void emitRaw(std::string const& text);
    // Re-sends the current record of `id` with an explicit last_updated.
    void emitStateWithTimestamp(EntityId const& id, std::string state, Timestamp last_updated);

    void setAccessToken(std::string token);
    void setRejectCommands(bool reject);
    // When false, accepted commands update no state until releaseConfirmations().
    void setConfirmCommands(bool confirm);
    void releaseConfirmations();
    void setRefuseConnections(bool refuse);
    void setRespondToPing(bool respond);
    void dropConnections();

    [[nodiscard]] auto connectionAttempts() const -> std::size_t;
    [[nodiscard]] auto receivedPings() const -> std::size_t;
    [[nodiscard]] auto activeConnections() const -> std::size_t;
    [[nodiscard]] auto receivedCalls() const -> std::vector<ServiceCall>;
    [[nodiscard]] auto subscribedConnections() const -> std::size_t;

    auto connect() -> Expected<std::shared_ptr<Connection>>;
    auto deliver(Connection& connection, std::string_view text) -> Expected<void>;
    auto next(Connection& connection, std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>>;
    void disconnect(Connection& connection);

private:
    struct Pending {
        EntityId    id;
        std::string state;
    };

    auto advanceClock() -> Timestamp;
    auto makeRecord(EntityId const& id) const -> nlohmann::json;
    void broadcastLocked(EntityId const& id, nlohmann::json new_state, Timestamp fired);
    void pushLocked(Connection& connection, std::string text);
    void handleLocked(Connection& connection, nlohmann::json const& message);
    void applyCommandLocked(Pending const& pending);

    struct Record {
        std::string    state;
        nlohmann::json attributes;
        Timestamp      last_updated;
    };

    mutable std::mutex                       mutex_;
    std::condition_variable                  cv_;
    std::string                              access_token_;
    std::map<EntityId, Record>               entities_;
    std::vector<std::shared_ptr<Connection>> connections_;
    std::vector<ServiceCall>                 calls_;
    std::vector<Pending>                     withheld_;
    Timestamp                                clock_;
    std::size_t                              attempts_{0};
    std::size_t                              pings_{0};
    bool                                     reject_commands_{false};
    bool                                     confirm_commands_{true};
    bool                                     refuse_connections_{false};
    bool                                     respond_to_ping_{true};
};

class Session final : public UpstreamSession {
public:
    Session(std::shared_ptr<Hub> hub, std::shared_ptr<Hub::Connection> connection)
        : hub_(std::move(hub))
        , connection_(std::move(connection)) {}

    ~Session() override { close(); }

    auto send(std::string_view text) -> Expected<void> override;
    auto receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> override;
    void close() override;

private:
    std::shared_ptr<Hub>             hub_;
    std::shared_ptr<Hub::Connection> connection_;
};

class Factory final : public UpstreamSessionFactory {
public:
    explicit Factory(std::shared_ptr<Hub> hub)
        : hub_(std::move(hub)) {}

    auto create(UpstreamOptions const& options) -> Expected<std::shared_ptr<UpstreamSession>> override;

private:
    std::shared_ptr<Hub> hub_;
};

[[nodiscard]] inline auto makeFactory(std::shared_ptr<Hub> hub) -> std::shared_ptr<UpstreamSessionFactory> {
    return std::make_shared<Factory>(std::move(hub));
}

} // namespace HC::Upstream::Loopback
