#include "upstream/UpstreamProtocol.hpp"

#include "core/TimeUtils.hpp"

#include <utility>

namespace HC::Upstream {

namespace {

using Json = nlohmann::json;

[[nodiscard]] auto make_error(Error::Code code,
                              std::string_view field,
                              std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] auto read_string(Json const& json, char const* key, Error::Code code) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(code, key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(make_error(code, key, "is required"));
}

[[nodiscard]] auto read_optional_string(Json const& json, char const* key) -> std::optional<std::string> {
    if (auto it = json.find(key); it != json.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

[[nodiscard]] auto read_id(Json const& json) -> Expected<std::uint64_t> {
    auto it = json.find("id");
    if (it == json.end()) {
        return std::unexpected(make_error(Error::Code::ProtocolError, "id", "is required"));
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(it->get<std::int64_t>());
    }
    return std::unexpected(make_error(Error::Code::ProtocolError, "id", "must be a non-negative integer"));
}

[[nodiscard]] auto decode_result(Json const& json) -> Expected<ResultMessage> {
    auto id = read_id(json);
    if (!id) {
        return std::unexpected(id.error());
    }
    auto success_it = json.find("success");
    if (success_it == json.end() || !success_it->is_boolean()) {
        return std::unexpected(make_error(Error::Code::ProtocolError, "success", "must be a boolean"));
    }
    ResultMessage message;
    message.id      = *id;
    message.success = success_it->get<bool>();
    if (auto result_it = json.find("result"); result_it != json.end()) {
        message.result = *result_it;
    }
    if (auto error_it = json.find("error"); error_it != json.end() && error_it->is_object()) {
        ErrorPayload payload;
        payload.code    = read_optional_string(*error_it, "code").value_or("unknown_error");
        payload.message = read_optional_string(*error_it, "message").value_or(payload.code);
        message.error   = std::move(payload);
    }
    return message;
}

} // namespace

auto messageKindToString(MessageKind kind) -> std::string_view {
    switch (kind) {
    case MessageKind::AuthRequired:
        return "auth_required";
    case MessageKind::AuthOk:
        return "auth_ok";
    case MessageKind::AuthInvalid:
        return "auth_invalid";
    case MessageKind::Result:
        return "result";
    case MessageKind::Event:
        return "event";
    case MessageKind::Pong:
        return "pong";
    case MessageKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

auto decodeMessage(std::string_view text) -> Expected<InboundMessage> {
    auto json = Json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(make_error(Error::Code::ProtocolError, "message", "invalid JSON payload"));
    }
    if (!json.is_object()) {
        return std::unexpected(make_error(Error::Code::ProtocolError, "message", "must be a JSON object"));
    }
    auto type = read_string(json, "type", Error::Code::ProtocolError);
    if (!type) {
        return std::unexpected(type.error());
    }

    InboundMessage message;
    if (*type == "auth_required") {
        message.kind    = MessageKind::AuthRequired;
        message.payload = AuthRequired{read_optional_string(json, "ha_version").value_or("")};
    } else if (*type == "auth_ok") {
        message.kind    = MessageKind::AuthOk;
        message.payload = AuthOk{read_optional_string(json, "ha_version").value_or("")};
    } else if (*type == "auth_invalid") {
        message.kind    = MessageKind::AuthInvalid;
        message.payload = AuthInvalid{read_optional_string(json, "message").value_or("invalid access token")};
    } else if (*type == "result") {
        auto result = decode_result(json);
        if (!result) {
            return std::unexpected(result.error());
        }
        message.kind    = MessageKind::Result;
        message.payload = std::move(*result);
    } else if (*type == "event") {
        auto id = read_id(json);
        if (!id) {
            return std::unexpected(id.error());
        }
        EventMessage event;
        event.id = *id;
        if (auto it = json.find("event"); it != json.end()) {
            event.event = std::move(*it);
        }
        message.kind    = MessageKind::Event;
        message.payload = std::move(event);
    } else if (*type == "pong") {
        auto id = read_id(json);
        if (!id) {
            return std::unexpected(id.error());
        }
        message.kind    = MessageKind::Pong;
        message.payload = PongMessage{*id};
    } else {
        message.kind    = MessageKind::Unknown;
        message.payload = UnknownMessage{*type};
    }
    return message;
}

auto decodeEntityState(Json const& record) -> Expected<EntityState> {
    if (!record.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "state", "must be a JSON object"));
    }
    auto entity_id = read_string(record, "entity_id", Error::Code::MalformedEvent);
    if (!entity_id) {
        return std::unexpected(entity_id.error());
    }
    if (!isValidEntityId(*entity_id)) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "entity_id", "is not a valid entity id"));
    }
    auto state = read_string(record, "state", Error::Code::MalformedEvent);
    if (!state) {
        return std::unexpected(state.error());
    }
    auto stamp_text = read_optional_string(record, "last_updated");
    if (!stamp_text) {
        stamp_text = read_optional_string(record, "last_changed");
    }
    if (!stamp_text) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "last_updated", "is required"));
    }
    auto stamp = parse_timestamp(*stamp_text);
    if (!stamp) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "last_updated",
                                          stamp.error().message.value_or("invalid timestamp")));
    }

    Json attributes = Json::object();
    if (auto it = record.find("attributes"); it != record.end()) {
        if (!it->is_object()) {
            return std::unexpected(make_error(Error::Code::MalformedEvent, "attributes", "must be an object"));
        }
        attributes = *it;
    }
    return makeEntityState(std::move(*entity_id), *state, std::move(attributes), *stamp);
}

auto decodeStateChange(EventMessage const& message) -> Expected<StateChange> {
    auto const& event = message.event;
    if (!event.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "event", "must be a JSON object"));
    }
    auto event_type = read_string(event, "event_type", Error::Code::MalformedEvent);
    if (!event_type) {
        return std::unexpected(event_type.error());
    }
    if (*event_type != kStateChangedEvent) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "event_type", "unsupported: " + *event_type));
    }
    auto data_it = event.find("data");
    if (data_it == event.end() || !data_it->is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "data", "must be an object"));
    }
    auto entity_id = read_string(*data_it, "entity_id", Error::Code::MalformedEvent);
    if (!entity_id) {
        return std::unexpected(entity_id.error());
    }

    auto new_state_it = data_it->find("new_state");
    if (new_state_it == data_it->end() || new_state_it->is_null()) {
        auto fired_text = read_optional_string(event, "time_fired");
        if (!fired_text) {
            return std::unexpected(make_error(Error::Code::MalformedEvent, "time_fired", "is required for removals"));
        }
        auto fired = parse_timestamp(*fired_text);
        if (!fired) {
            return std::unexpected(make_error(Error::Code::MalformedEvent, "time_fired",
                                              fired.error().message.value_or("invalid timestamp")));
        }
        auto tombstone = makeTombstone(*entity_id, *fired);
        return StateChange{std::move(*entity_id), std::move(tombstone)};
    }

    auto state = decodeEntityState(*new_state_it);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (state->id != *entity_id) {
        return std::unexpected(make_error(Error::Code::MalformedEvent, "new_state", "entity_id does not match event"));
    }
    return StateChange{std::move(*entity_id), std::move(*state)};
}

auto decodeStateDump(Json const& result) -> Expected<std::vector<Expected<EntityState>>> {
    if (!result.is_array()) {
        return std::unexpected(make_error(Error::Code::ProtocolError, "get_states", "result must be an array"));
    }
    std::vector<Expected<EntityState>> states;
    states.reserve(result.size());
    for (auto const& record : result) {
        states.push_back(decodeEntityState(record));
    }
    return states;
}

auto encodeAuth(std::string_view access_token) -> std::string {
    return Json{{"type", "auth"}, {"access_token", access_token}}.dump();
}

auto encodeSubscribeEvents(std::uint64_t id, std::string_view event_type) -> std::string {
    return Json{{"id", id}, {"type", "subscribe_events"}, {"event_type", event_type}}.dump();
}

auto encodeGetStates(std::uint64_t id) -> std::string {
    return Json{{"id", id}, {"type", "get_states"}}.dump();
}

auto encodeCallService(std::uint64_t id, ServiceCall const& call) -> std::string {
    Json json{{"id", id},
              {"type", "call_service"},
              {"domain", call.domain},
              {"service", call.service},
              {"target", Json{{"entity_id", call.entity_id}}}};
    if (call.service_data.is_object() && !call.service_data.empty()) {
        json["service_data"] = call.service_data;
    }
    return json.dump();
}

auto encodePing(std::uint64_t id) -> std::string {
    return Json{{"id", id}, {"type", "ping"}}.dump();
}

auto makeToggleCall(EntityId const& entity_id, bool desired) -> Expected<ServiceCall> {
    auto domain = entityDomain(entity_id);
    if (domain.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "invalid entity id '" + entity_id + "'"});
    }
    ServiceCall call;
    call.domain    = std::string{domain};
    call.service   = desired ? "turn_on" : "turn_off";
    call.entity_id = entity_id;
    return call;
}

} // namespace HC::Upstream
