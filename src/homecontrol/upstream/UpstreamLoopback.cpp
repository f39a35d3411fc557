#include "upstream/UpstreamLoopback.hpp"

#include <algorithm>
#include <utility>

namespace HC::Upstream::Loopback {

using Json = nlohmann::json;

struct Hub::Connection {
    std::deque<std::string>      outbox;
    bool                         authenticated{false};
    std::optional<std::uint64_t> subscription;
    bool                         dropped{false};
    bool                         closed{false};
};

Hub::Hub(std::string access_token)
    : access_token_(std::move(access_token))
    , clock_(std::chrono::sys_days{std::chrono::year{2024} / std::chrono::January / 1}) {}

auto Hub::advanceClock() -> Timestamp {
    clock_ += std::chrono::seconds{1};
    return clock_;
}

auto Hub::makeRecord(EntityId const& id) const -> Json {
    auto const& record = entities_.at(id);
    auto        stamp  = format_timestamp(record.last_updated);
    return Json{{"entity_id", id},
                {"state", record.state},
                {"attributes", record.attributes},
                {"last_changed", stamp},
                {"last_updated", stamp},
                {"context", Json::object()}};
}

void Hub::pushLocked(Connection& connection, std::string text) {
    if (connection.closed || connection.dropped) {
        return;
    }
    connection.outbox.push_back(std::move(text));
}

void Hub::broadcastLocked(EntityId const& id, Json new_state, Timestamp fired) {
    for (auto const& connection : connections_) {
        if (!connection->subscription) {
            continue;
        }
        Json event{{"id", *connection->subscription},
                   {"type", "event"},
                   {"event",
                    {{"event_type", std::string{kStateChangedEvent}},
                     {"data", {{"entity_id", id}, {"new_state", new_state}}},
                     {"time_fired", format_timestamp(fired)},
                     {"origin", "LOCAL"}}}};
        pushLocked(*connection, event.dump());
    }
    cv_.notify_all();
}

void Hub::setEntity(EntityId const& id, std::string state, Json attributes, bool notify) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        stamp = advanceClock();
    entities_[id] = Record{std::move(state), std::move(attributes), stamp};
    if (notify) {
        broadcastLocked(id, makeRecord(id), stamp);
    }
}

void Hub::removeEntity(EntityId const& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entities_.erase(id);
    broadcastLocked(id, Json(nullptr), advanceClock());
}

auto Hub::entityState(EntityId const& id) const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

void Hub::emitRaw(std::string const& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const& connection : connections_) {
        if (connection->subscription) {
            pushLocked(*connection, text);
        }
    }
    cv_.notify_all();
}

void Hub::emitStateWithTimestamp(EntityId const& id, std::string state, Timestamp last_updated) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record        = entities_[id];
    record.state        = std::move(state);
    record.last_updated = last_updated;
    if (!record.attributes.is_object()) {
        record.attributes = Json::object();
    }
    broadcastLocked(id, makeRecord(id), last_updated);
}

void Hub::setAccessToken(std::string token) {
    std::lock_guard<std::mutex> lock(mutex_);
    access_token_ = std::move(token);
}

void Hub::setRejectCommands(bool reject) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_commands_ = reject;
}

void Hub::setConfirmCommands(bool confirm) {
    std::lock_guard<std::mutex> lock(mutex_);
    confirm_commands_ = confirm;
}

void Hub::releaseConfirmations() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto pending = std::exchange(withheld_, {});
    for (auto const& item : pending) {
        applyCommandLocked(item);
    }
}

void Hub::setRefuseConnections(bool refuse) {
    std::lock_guard<std::mutex> lock(mutex_);
    refuse_connections_ = refuse;
}

void Hub::setRespondToPing(bool respond) {
    std::lock_guard<std::mutex> lock(mutex_);
    respond_to_ping_ = respond;
}

void Hub::dropConnections() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const& connection : connections_) {
        connection->dropped = true;
        connection->outbox.clear();
    }
    connections_.clear();
    cv_.notify_all();
}

auto Hub::connectionAttempts() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

auto Hub::receivedPings() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pings_;
}

auto Hub::activeConnections() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

auto Hub::subscribedConnections() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(), [](auto const& c) {
        return c->subscription.has_value();
    }));
}

auto Hub::receivedCalls() const -> std::vector<ServiceCall> {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

auto Hub::connect() -> Expected<std::shared_ptr<Connection>> {
    std::lock_guard<std::mutex> lock(mutex_);
    ++attempts_;
    if (refuse_connections_) {
        return std::unexpected(Error{Error::Code::TransportFailure, "connection refused"});
    }
    auto connection = std::make_shared<Connection>();
    connection->outbox.push_back(Json{{"type", "auth_required"}, {"ha_version", "loopback"}}.dump());
    connections_.push_back(connection);
    return connection;
}

void Hub::applyCommandLocked(Pending const& pending) {
    auto stamp = advanceClock();
    auto it    = entities_.find(pending.id);
    if (it == entities_.end()) {
        entities_[pending.id] = Record{pending.state, Json::object(), stamp};
    } else {
        it->second.state        = pending.state;
        it->second.last_updated = stamp;
    }
    broadcastLocked(pending.id, makeRecord(pending.id), stamp);
}

void Hub::handleLocked(Connection& connection, Json const& message) {
    auto type = message.value("type", std::string{});
    if (type == "auth") {
        if (message.value("access_token", std::string{}) == access_token_) {
            connection.authenticated = true;
            pushLocked(connection, Json{{"type", "auth_ok"}, {"ha_version", "loopback"}}.dump());
        } else {
            pushLocked(connection, Json{{"type", "auth_invalid"}, {"message", "Invalid access token"}}.dump());
        }
        return;
    }
    if (!connection.authenticated) {
        connection.dropped = true;
        return;
    }

    auto id = message.value("id", std::uint64_t{0});
    if (type == "subscribe_events") {
        connection.subscription = id;
        pushLocked(connection, Json{{"id", id}, {"type", "result"}, {"success", true}, {"result", nullptr}}.dump());
    } else if (type == "get_states") {
        auto states = Json::array();
        for (auto const& [entity_id, record] : entities_) {
            (void)record;
            states.push_back(makeRecord(entity_id));
        }
        pushLocked(connection, Json{{"id", id}, {"type", "result"}, {"success", true}, {"result", states}}.dump());
    } else if (type == "call_service") {
        ServiceCall call;
        call.domain  = message.value("domain", std::string{});
        call.service = message.value("service", std::string{});
        if (auto target = message.find("target"); target != message.end() && target->is_object()) {
            call.entity_id = target->value("entity_id", std::string{});
        }
        if (auto data = message.find("service_data"); data != message.end()) {
            call.service_data = *data;
        }
        calls_.push_back(call);
        if (reject_commands_) {
            pushLocked(connection,
                       Json{{"id", id},
                            {"type", "result"},
                            {"success", false},
                            {"error", {{"code", "home_assistant_error"}, {"message", "Service call rejected"}}}}
                           .dump());
            return;
        }
        pushLocked(connection,
                   Json{{"id", id}, {"type", "result"}, {"success", true}, {"result", {{"context", Json::object()}}}}
                       .dump());
        if (call.service == "turn_on" || call.service == "turn_off") {
            Pending pending{call.entity_id, call.service == "turn_on" ? "on" : "off"};
            if (confirm_commands_) {
                applyCommandLocked(pending);
            } else {
                withheld_.push_back(std::move(pending));
            }
        }
    } else if (type == "ping") {
        ++pings_;
        if (respond_to_ping_) {
            pushLocked(connection, Json{{"id", id}, {"type", "pong"}}.dump());
        }
    } else {
        pushLocked(connection,
                   Json{{"id", id},
                        {"type", "result"},
                        {"success", false},
                        {"error", {{"code", "unknown_command"}, {"message", "Unknown command."}}}}
                       .dump());
    }
}

auto Hub::deliver(Connection& connection, std::string_view text) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection.closed || connection.dropped) {
        return std::unexpected(Error{Error::Code::TransportFailure, "connection dropped"});
    }
    auto message = Json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        connection.dropped = true;
        cv_.notify_all();
        return std::unexpected(Error{Error::Code::TransportFailure, "hub closed connection after invalid message"});
    }
    handleLocked(connection, message);
    cv_.notify_all();
    return {};
}

auto Hub::next(Connection& connection, std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return !connection.outbox.empty() || connection.dropped || connection.closed; });
    if (connection.dropped || connection.closed) {
        return std::unexpected(Error{Error::Code::TransportFailure, "connection dropped"});
    }
    if (connection.outbox.empty()) {
        return std::optional<std::string>{};
    }
    auto text = std::move(connection.outbox.front());
    connection.outbox.pop_front();
    return std::optional<std::string>{std::move(text)};
}

void Hub::disconnect(Connection& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    connection.closed = true;
    std::erase_if(connections_, [&](auto const& candidate) { return candidate.get() == &connection; });
    cv_.notify_all();
}

auto Session::send(std::string_view text) -> Expected<void> {
    if (!connection_) {
        return std::unexpected(Error{Error::Code::TransportFailure, "session closed"});
    }
    return hub_->deliver(*connection_, text);
}

auto Session::receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> {
    if (!connection_) {
        return std::unexpected(Error{Error::Code::TransportFailure, "session closed"});
    }
    return hub_->next(*connection_, timeout);
}

void Session::close() {
    if (hub_ && connection_) {
        hub_->disconnect(*connection_);
        connection_.reset();
    }
}

auto Factory::create(UpstreamOptions const&) -> Expected<std::shared_ptr<UpstreamSession>> {
    if (!hub_) {
        return std::unexpected(Error{Error::Code::TransportFailure, "hub unavailable"});
    }
    auto connection = hub_->connect();
    if (!connection) {
        return std::unexpected(connection.error());
    }
    return std::make_shared<Session>(hub_, std::move(*connection));
}

} // namespace HC::Upstream::Loopback
