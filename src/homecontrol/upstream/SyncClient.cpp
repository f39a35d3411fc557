#include "upstream/SyncClient.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace HC::Upstream {
namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

[[nodiscard]] auto unexpected_message(InboundMessage const& message, std::string_view phase) -> Error {
    return make_error(Error::Code::ProtocolError,
                      "unexpected " + std::string{messageKindToString(message.kind)} + " during " + std::string{phase});
}

} // namespace

SyncClient::SyncClient(EntityCache& cache, std::shared_ptr<UpstreamSessionFactory> factory, SyncClientOptions options)
    : cache_(cache)
    , factory_(std::move(factory))
    , options_(std::move(options))
    , backoff_(options_.backoff) {}

SyncClient::~SyncClient() {
    stop();
}

void SyncClient::start() {
    if (running_.exchange(true)) {
        return;
    }
    stop_requested_ = false;
    worker_         = std::thread([this]() { run(); });
}

void SyncClient::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto SyncClient::connectionState() const -> ConnectionState {
    return state_.load();
}

auto SyncClient::stats() const -> SyncStats {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

auto SyncClient::waitForState(ConnectionState target, std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return state_.load() == target; });
}

auto SyncClient::callService(ServiceCall const& call, std::chrono::milliseconds timeout) -> Expected<void> {
    auto pending  = std::make_shared<PendingCommand>();
    pending->call = call;
    auto future   = pending->promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != ConnectionState::Subscribed) {
            return std::unexpected(make_error(Error::Code::Unreachable, "not connected to the source"));
        }
        outbound_.push_back(pending);
    }
    wake_cv_.notify_all();

    if (future.wait_for(timeout) != std::future_status::ready) {
        hc_log("No acknowledgment for " + call.domain + "." + call.service + " on " + call.entity_id, "WARN",
               "Sync");
        return std::unexpected(make_error(Error::Code::Timeout, "source did not acknowledge the command"));
    }
    return future.get();
}

void SyncClient::setState(ConnectionState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.store(state);
    }
    state_cv_.notify_all();
}

void SyncClient::sleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    wake_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

void SyncClient::run() {
#if !defined(HC_LOG_DISABLED)
    set_thread_name("UpstreamSync");
#endif
    while (!stop_requested_.load()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.connection_attempts;
        }
        setState(ConnectionState::Connecting);
        hc_log("Connecting to " + options_.upstream.url, "INFO", "Sync");

        auto  session = factory_->create(options_.upstream);
        Error reason  = session ? runSession(**session) : session.error();

        handleDisconnect(reason);
        if (session) {
            (*session)->close();
        }
        if (stop_requested_.load()) {
            break;
        }
        auto delay = backoff_.nextDelay();
        hc_log("Upstream unavailable (" + describeError(reason) + "); retrying in " + std::to_string(delay.count())
                   + " ms",
               "WARN", "Sync");
        sleepFor(delay);
    }
    setState(ConnectionState::Disconnected);
}

void SyncClient::handleDisconnect(Error const& reason) {
    std::deque<PendingPtr>              queued;
    std::map<std::uint64_t, PendingPtr> waiting;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.store(ConnectionState::Disconnected);
        queued            = std::exchange(outbound_, {});
        waiting           = std::exchange(in_flight_, {});
        stats_.last_error = describeError(reason);
    }
    state_cv_.notify_all();
    backoff_.onDisconnected(Clock::now());

    auto const unreachable = make_error(Error::Code::Unreachable, "connection to the source was lost");
    for (auto const& pending : queued) {
        pending->promise.set_value(std::unexpected(unreachable));
    }
    for (auto const& [id, pending] : waiting) {
        (void)id;
        pending->promise.set_value(std::unexpected(unreachable));
    }
    // Dispatchers waiting for confirmation re-check connectivity.
    cache_.interruptWaiters();
}

auto SyncClient::receiveWithin(UpstreamSession& session, std::chrono::milliseconds timeout)
    -> Expected<InboundMessage> {
    auto deadline = Clock::now() + timeout;
    while (!stop_requested_.load()) {
        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto text      = session.receive(std::min(remaining, options_.receive_poll));
        if (!text) {
            return std::unexpected(text.error());
        }
        if (*text) {
            return decodeMessage(**text);
        }
    }
    return std::unexpected(make_error(Error::Code::Timeout, "no message from the source"));
}

auto SyncClient::authenticate(UpstreamSession& session) -> Expected<void> {
    auto greeting = receiveWithin(session, options_.idle_timeout);
    if (!greeting) {
        return std::unexpected(greeting.error());
    }
    if (greeting->kind != MessageKind::AuthRequired) {
        return std::unexpected(unexpected_message(*greeting, "authentication"));
    }
    if (auto sent = session.send(encodeAuth(options_.upstream.access_token)); !sent) {
        return sent;
    }
    auto reply = receiveWithin(session, options_.idle_timeout);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (reply->kind == MessageKind::AuthInvalid) {
        auto const& invalid = std::get<AuthInvalid>(reply->payload);
        return std::unexpected(make_error(Error::Code::AuthenticationFailed, invalid.message));
    }
    if (reply->kind != MessageKind::AuthOk) {
        return std::unexpected(unexpected_message(*reply, "authentication"));
    }
    return {};
}

auto SyncClient::runSession(UpstreamSession& session) -> Error {
    setState(ConnectionState::Authenticating);
    if (auto authenticated = authenticate(session); !authenticated) {
        if (authenticated.error().code == Error::Code::AuthenticationFailed) {
            hc_log("Source rejected the access token: " + describeError(authenticated.error()), "ERROR", "Sync");
        }
        return authenticated.error();
    }

    std::uint64_t subscribe_id = 0;
    std::uint64_t states_id    = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next_id_     = 1;
        subscribe_id = next_id_++;
        states_id    = next_id_++;
    }
    if (auto sent = session.send(encodeSubscribeEvents(subscribe_id)); !sent) {
        return sent.error();
    }
    if (auto sent = session.send(encodeGetStates(states_id)); !sent) {
        return sent.error();
    }

    bool subscribed_ok = false;
    bool dump_applied  = false;
    auto last_inbound  = Clock::now();
    // Any outbound message resets the heartbeat; pings only fill silence.
    auto last_outbound = Clock::now();

    while (!stop_requested_.load()) {
        auto now = Clock::now();
        if (state_.load() == ConnectionState::Subscribed) {
            auto flushed = flushOutbound(session);
            if (!flushed) {
                return flushed.error();
            }
            if (*flushed > 0) {
                last_outbound = Clock::now();
                now           = last_outbound;
            }
            backoff_.onHeartbeat(now);
        }
        if (now - last_outbound >= options_.heartbeat_interval) {
            std::uint64_t ping_id = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ping_id = next_id_++;
            }
            if (auto sent = session.send(encodePing(ping_id)); !sent) {
                return sent.error();
            }
            last_outbound = now;
        }
        if (now - last_inbound >= options_.idle_timeout) {
            return make_error(Error::Code::Timeout, "no message from the source within the idle timeout");
        }

        auto text = session.receive(options_.receive_poll);
        if (!text) {
            return text.error();
        }
        if (!*text) {
            continue;
        }
        last_inbound = Clock::now();

        auto message = decodeMessage(**text);
        if (!message) {
            return message.error();
        }

        switch (message->kind) {
        case MessageKind::Event: {
            auto const& event = std::get<EventMessage>(message->payload);
            if (event.id != subscribe_id) {
                hc_log("Ignoring event for subscription " + std::to_string(event.id), "DEBUG", "Sync");
                break;
            }
            applyEvent(event);
            break;
        }
        case MessageKind::Result: {
            auto const& result = std::get<ResultMessage>(message->payload);
            if (result.id == subscribe_id) {
                if (!result.success) {
                    return make_error(Error::Code::ProtocolError,
                                      "subscription refused: "
                                          + (result.error ? result.error->message : std::string{"no reason"}));
                }
                subscribed_ok = true;
            } else if (result.id == states_id) {
                if (auto applied = applyDump(result); !applied) {
                    return applied.error();
                }
                dump_applied = true;
            } else {
                completeCommand(result);
            }
            if (subscribed_ok && dump_applied && state_.load() != ConnectionState::Subscribed) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    ++stats_.subscriptions;
                }
                setState(ConnectionState::Subscribed);
                backoff_.onSubscribed(Clock::now());
                hc_log("Subscribed to the source; " + std::to_string(cache_.size()) + " entities cached", "INFO",
                       "Sync");
            }
            break;
        }
        case MessageKind::Pong:
            break;
        case MessageKind::Unknown:
            hc_log("Ignoring message of type " + std::get<UnknownMessage>(message->payload).type, "DEBUG", "Sync");
            break;
        case MessageKind::AuthRequired:
        case MessageKind::AuthOk:
        case MessageKind::AuthInvalid:
            return unexpected_message(*message, "subscription");
        }
    }
    return make_error(Error::Code::Unreachable, "sync client stopped");
}

auto SyncClient::flushOutbound(UpstreamSession& session) -> Expected<std::size_t> {
    std::vector<std::pair<std::uint64_t, PendingPtr>> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!outbound_.empty()) {
            auto id = next_id_++;
            in_flight_.emplace(id, outbound_.front());
            batch.emplace_back(id, std::move(outbound_.front()));
            outbound_.pop_front();
        }
    }
    for (auto const& [id, pending] : batch) {
        if (auto sent = session.send(encodeCallService(id, pending->call)); !sent) {
            return std::unexpected(sent.error());
        }
        hc_log("Sent " + pending->call.domain + "." + pending->call.service + " for " + pending->call.entity_id,
               "DEBUG", "Sync");
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.commands_sent;
    }
    return batch.size();
}

void SyncClient::completeCommand(ResultMessage const& result) {
    PendingPtr pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(result.id);
        if (it == in_flight_.end()) {
            return;
        }
        pending = std::move(it->second);
        in_flight_.erase(it);
        if (!result.success) {
            ++stats_.commands_rejected;
        }
    }
    if (result.success) {
        pending->promise.set_value(Expected<void>{});
        return;
    }
    auto reason = result.error ? result.error->code + ": " + result.error->message : std::string{"call failed"};
    hc_log("Source rejected " + pending->call.service + " for " + pending->call.entity_id + " (" + reason + ")",
           "WARN", "Sync");
    pending->promise.set_value(std::unexpected(make_error(Error::Code::CommandRejected, reason)));
}

void SyncClient::applyEvent(EventMessage const& event) {
    auto change = decodeStateChange(event);
    if (!change) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.malformed_events;
        }
        hc_log("Skipped malformed event: " + describeError(change.error()), "WARN", "Sync");
        return;
    }
    cache_.apply(std::move(change->state));
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.events_applied;
}

auto SyncClient::applyDump(ResultMessage const& result) -> Expected<void> {
    if (!result.success) {
        return std::unexpected(make_error(Error::Code::ProtocolError,
                                          "state dump refused: "
                                              + (result.error ? result.error->message : std::string{"no reason"})));
    }
    auto records = decodeStateDump(result.result);
    if (!records) {
        return std::unexpected(records.error());
    }
    // A malformed record still proves its entity exists.
    phmap::flat_hash_set<EntityId> present;
    for (auto const& raw : result.result) {
        if (raw.is_object()) {
            if (auto it = raw.find("entity_id"); it != raw.end() && it->is_string()) {
                present.insert(it->get<std::string>());
            }
        }
    }

    std::uint64_t skipped = 0;
    for (auto& record : *records) {
        if (!record) {
            ++skipped;
            hc_log("Skipped malformed state record: " + describeError(record.error()), "WARN", "Sync");
            continue;
        }
        cache_.apply(std::move(*record));
    }

    // Entities removed while we were away get no event; the dump is authoritative.
    // Stamped just past the last known state so any later record from the source supersedes it.
    auto snapshot = cache_.snapshot();
    for (auto const& [id, state] : snapshot.entities) {
        if (present.contains(id) || isTombstone(*state)) {
            continue;
        }
        auto removed_at = state->last_updated + std::chrono::microseconds{1};
        hc_log("Entity " + id + " is gone from the source", "DEBUG", "Sync");
        cache_.apply(makeTombstone(id, std::chrono::time_point_cast<Timestamp::duration>(removed_at)));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.malformed_events += skipped;
    return {};
}

} // namespace HC::Upstream
