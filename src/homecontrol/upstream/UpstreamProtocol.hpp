#pragma once

#include "entity/EntityState.hpp"

#include <homecontrol/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace HC::Upstream {

inline constexpr std::string_view kStateChangedEvent{"state_changed"};

enum class MessageKind {
    AuthRequired,
    AuthOk,
    AuthInvalid,
    Result,
    Event,
    Pong,
    Unknown,
};

struct ErrorPayload {
    std::string code;
    std::string message;
};

struct AuthRequired {
    std::string version;
};

struct AuthOk {
    std::string version;
};

struct AuthInvalid {
    std::string message;
};

struct ResultMessage {
    std::uint64_t               id{0};
    bool                        success{false};
    nlohmann::json              result;
    std::optional<ErrorPayload> error;
};

// The event body is decoded lazily so one bad record never poisons the frame.
struct EventMessage {
    std::uint64_t  id{0};
    nlohmann::json event;
};

struct PongMessage {
    std::uint64_t id{0};
};

struct UnknownMessage {
    std::string type;
};

struct InboundMessage {
    MessageKind kind{MessageKind::Unknown};
    std::variant<AuthRequired, AuthOk, AuthInvalid, ResultMessage, EventMessage, PongMessage, UnknownMessage>
        payload{UnknownMessage{}};
};

struct ServiceCall {
    std::string    domain;
    std::string    service;
    EntityId       entity_id;
    nlohmann::json service_data = nlohmann::json::object();
};

struct StateChange {
    EntityId    entity_id;
    EntityState state;
};

[[nodiscard]] auto messageKindToString(MessageKind kind) -> std::string_view;

// Text that is not a JSON object with a string `type` is a ProtocolError.
[[nodiscard]] auto decodeMessage(std::string_view text) -> Expected<InboundMessage>;

// Failures are MalformedEvent: the record is skipped, the connection survives.
[[nodiscard]] auto decodeEntityState(nlohmann::json const& record) -> Expected<EntityState>;
[[nodiscard]] auto decodeStateChange(EventMessage const& message) -> Expected<StateChange>;
[[nodiscard]] auto decodeStateDump(nlohmann::json const& result)
    -> Expected<std::vector<Expected<EntityState>>>;

[[nodiscard]] auto encodeAuth(std::string_view access_token) -> std::string;
[[nodiscard]] auto encodeSubscribeEvents(std::uint64_t id, std::string_view event_type = kStateChangedEvent)
    -> std::string;
[[nodiscard]] auto encodeGetStates(std::uint64_t id) -> std::string;
[[nodiscard]] auto encodeCallService(std::uint64_t id, ServiceCall const& call) -> std::string;
[[nodiscard]] auto encodePing(std::uint64_t id) -> std::string;

[[nodiscard]] auto makeToggleCall(EntityId const& entity_id, bool desired) -> Expected<ServiceCall>;

} // namespace HC::Upstream
