#include "upstream/UpstreamProtocol.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace HC;
using namespace HC::Upstream;

namespace {

auto decode(std::string const& text) -> InboundMessage {
    auto message = decodeMessage(text);
    REQUIRE(message.has_value());
    return *message;
}

auto state_record(std::string const& id, std::string const& state, std::string const& stamp) -> nlohmann::json {
    return nlohmann::json{{"entity_id", id},
                          {"state", state},
                          {"attributes", nlohmann::json::object()},
                          {"last_changed", stamp},
                          {"last_updated", stamp}};
}

} // namespace

TEST_SUITE("upstream.protocol") {
    TEST_CASE("Handshake messages are recognised") {
        auto required = decode(R"({"type":"auth_required","ha_version":"2024.1.0"})");
        CHECK(required.kind == MessageKind::AuthRequired);
        CHECK(std::get<AuthRequired>(required.payload).version == "2024.1.0");

        CHECK(decode(R"({"type":"auth_ok"})").kind == MessageKind::AuthOk);

        auto invalid = decode(R"({"type":"auth_invalid","message":"Invalid access token"})");
        CHECK(invalid.kind == MessageKind::AuthInvalid);
        CHECK(std::get<AuthInvalid>(invalid.payload).message == "Invalid access token");
    }

    TEST_CASE("Results carry success and error payloads") {
        auto ok = decode(R"({"id":7,"type":"result","success":true,"result":null})");
        REQUIRE(ok.kind == MessageKind::Result);
        auto const& result = std::get<ResultMessage>(ok.payload);
        CHECK(result.id == 7);
        CHECK(result.success);
        CHECK_FALSE(result.error.has_value());

        auto failed = decode(
            R"({"id":8,"type":"result","success":false,"error":{"code":"not_found","message":"Service not found"}})");
        auto const& failure = std::get<ResultMessage>(failed.payload);
        CHECK_FALSE(failure.success);
        REQUIRE(failure.error.has_value());
        CHECK(failure.error->code == "not_found");
        CHECK(failure.error->message == "Service not found");
    }

    TEST_CASE("Unknown types are tolerated and garbage is a protocol error") {
        auto unknown = decode(R"({"type":"something_new"})");
        CHECK(unknown.kind == MessageKind::Unknown);
        CHECK(std::get<UnknownMessage>(unknown.payload).type == "something_new");

        for (auto text : {"not json", "[1,2]", R"({"no_type":1})", R"({"type":"result","success":true})",
                          R"({"type":"result","id":-1,"success":true})"}) {
            CAPTURE(text);
            auto message = decodeMessage(text);
            REQUIRE_FALSE(message.has_value());
            CHECK(message.error().code == Error::Code::ProtocolError);
        }
    }

    TEST_CASE("State records decode with last_changed fallback") {
        auto record = state_record("light.kitchen", "on", "2024-01-01T10:00:00+00:00");
        auto state  = decodeEntityState(record);
        REQUIRE(state.has_value());
        CHECK(state->id == "light.kitchen");
        CHECK(asBool(*state) == std::optional<bool>{true});

        record.erase("last_updated");
        auto fallback = decodeEntityState(record);
        REQUIRE(fallback.has_value());
        CHECK(fallback->last_updated == state->last_updated);

        record.erase("last_changed");
        auto missing = decodeEntityState(record);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::MalformedEvent);
    }

    TEST_CASE("Malformed state records are MalformedEvent") {
        auto bad_id = state_record("kitchen", "on", "2024-01-01T10:00:00Z");
        CHECK(decodeEntityState(bad_id).error().code == Error::Code::MalformedEvent);

        auto bad_state = state_record("light.a", "on", "2024-01-01T10:00:00Z");
        bad_state["state"] = 5;
        CHECK(decodeEntityState(bad_state).error().code == Error::Code::MalformedEvent);

        auto bad_attributes = state_record("light.a", "on", "2024-01-01T10:00:00Z");
        bad_attributes["attributes"] = "x";
        CHECK(decodeEntityState(bad_attributes).error().code == Error::Code::MalformedEvent);

        auto bad_stamp = state_record("light.a", "on", "yesterday");
        CHECK(decodeEntityState(bad_stamp).error().code == Error::Code::MalformedEvent);
    }

    TEST_CASE("state_changed events decode to updates and removals") {
        EventMessage update;
        update.id    = 1;
        update.event = nlohmann::json{
            {"event_type", "state_changed"},
            {"time_fired", "2024-01-01T10:00:01Z"},
            {"data",
             {{"entity_id", "light.a"},
              {"old_state", nullptr},
              {"new_state", state_record("light.a", "off", "2024-01-01T10:00:01Z")}}}};
        auto change = decodeStateChange(update);
        REQUIRE(change.has_value());
        CHECK(change->entity_id == "light.a");
        CHECK(asBool(change->state) == std::optional<bool>{false});

        EventMessage removal;
        removal.event = nlohmann::json{{"event_type", "state_changed"},
                                       {"time_fired", "2024-01-01T10:00:02Z"},
                                       {"data", {{"entity_id", "light.a"}, {"new_state", nullptr}}}};
        auto removed = decodeStateChange(removal);
        REQUIRE(removed.has_value());
        CHECK(isTombstone(removed->state));
        CHECK(removed->state.last_updated > change->state.last_updated);

        EventMessage mismatched = update;
        mismatched.event["data"]["entity_id"] = "light.b";
        CHECK(decodeStateChange(mismatched).error().code == Error::Code::MalformedEvent);

        EventMessage other = update;
        other.event["event_type"] = "call_service";
        CHECK_FALSE(decodeStateChange(other).has_value());
    }

    TEST_CASE("State dumps keep per-record failures") {
        auto dump = nlohmann::json::array({state_record("light.a", "on", "2024-01-01T10:00:00Z"),
                                           nlohmann::json{{"entity_id", "broken"}},
                                           state_record("sensor.t", "21.5", "2024-01-01T10:00:00Z")});
        auto states = decodeStateDump(dump);
        REQUIRE(states.has_value());
        REQUIRE(states->size() == 3);
        CHECK((*states)[0].has_value());
        CHECK_FALSE((*states)[1].has_value());
        CHECK((*states)[2].has_value());

        CHECK(decodeStateDump(nlohmann::json::object()).error().code == Error::Code::ProtocolError);
    }

    TEST_CASE("Outbound messages carry ids and targets") {
        auto auth = nlohmann::json::parse(encodeAuth("secret"));
        CHECK(auth["type"] == "auth");
        CHECK(auth["access_token"] == "secret");

        auto subscribe = nlohmann::json::parse(encodeSubscribeEvents(1));
        CHECK(subscribe["id"] == 1);
        CHECK(subscribe["type"] == "subscribe_events");
        CHECK(subscribe["event_type"] == "state_changed");

        auto states = nlohmann::json::parse(encodeGetStates(2));
        CHECK(states["type"] == "get_states");

        auto call = makeToggleCall("light.kitchen", true);
        REQUIRE(call.has_value());
        CHECK(call->domain == "light");
        CHECK(call->service == "turn_on");
        auto encoded = nlohmann::json::parse(encodeCallService(3, *call));
        CHECK(encoded["id"] == 3);
        CHECK(encoded["type"] == "call_service");
        CHECK(encoded["target"]["entity_id"] == "light.kitchen");
        CHECK_FALSE(encoded.contains("service_data"));

        auto off = makeToggleCall("switch.porch", false);
        REQUIRE(off.has_value());
        CHECK(off->service == "turn_off");
        CHECK(makeToggleCall("porch", false).error().code == Error::Code::InvalidArgument);

        auto ping = nlohmann::json::parse(encodePing(9));
        CHECK(ping["type"] == "ping");
        CHECK(ping["id"] == 9);
    }
}
