#include "entity/EntityState.hpp"

#include <doctest/doctest.h>

using namespace HC;

namespace {

auto at(char const* text) -> Timestamp {
    auto parsed = parse_timestamp(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

} // namespace

TEST_SUITE("entity.state") {
    TEST_CASE("Entity ids are domain.object_id") {
        CHECK(isValidEntityId("light.kitchen"));
        CHECK(isValidEntityId("sensor.outdoor_temp_2"));
        CHECK_FALSE(isValidEntityId("kitchen"));
        CHECK_FALSE(isValidEntityId(".kitchen"));
        CHECK_FALSE(isValidEntityId("light."));
        CHECK_FALSE(isValidEntityId("Light.Kitchen"));
        CHECK_FALSE(isValidEntityId("light.kit chen"));
        CHECK_FALSE(isValidEntityId("light.kitchen.extra"));

        CHECK(entityDomain("switch.porch") == "switch");
        CHECK(entityDomain("bogus").empty());
    }

    TEST_CASE("States are classified by content") {
        auto empty = nlohmann::json::object();
        CHECK(classifyState("on", empty) == EntityValue{OnOff{true}});
        CHECK(classifyState("off", empty) == EntityValue{OnOff{false}});
        CHECK(classifyState("21.5", empty) == EntityValue{Numeric{21.5}});
        CHECK(classifyState("-3", empty) == EntityValue{Numeric{-3.0}});
        CHECK(classifyState("sunny", empty) == EntityValue{Text{"sunny"}});
        CHECK(classifyState("unavailable", empty) == EntityValue{Text{"unavailable"}});
        CHECK(classifyState("nan", empty) == EntityValue{Text{"nan"}});
        CHECK(classifyState("", nlohmann::json{{"latitude", 1.0}}) == EntityValue{Composite{}});
        CHECK(classifyState("", empty) == EntityValue{Text{""}});
    }

    TEST_CASE("Boolean view only covers on/off") {
        auto stamp = at("2024-01-01T00:00:00Z");
        CHECK(asBool(makeEntityState("light.a", "on", {}, stamp)) == std::optional<bool>{true});
        CHECK(asBool(makeEntityState("light.a", "off", {}, stamp)) == std::optional<bool>{false});
        CHECK_FALSE(asBool(makeEntityState("light.a", "unavailable", {}, stamp)).has_value());
        CHECK_FALSE(asBool(makeTombstone("light.a", stamp)).has_value());
    }

    TEST_CASE("Non-object attributes are replaced with an empty object") {
        auto state = makeEntityState("sensor.x", "1", nlohmann::json::array({1, 2}), at("2024-01-01T00:00:00Z"));
        CHECK(state.attributes.is_object());
        CHECK(state.attributes.empty());
    }

    TEST_CASE("Content comparison ignores timestamps") {
        auto a = makeEntityState("light.a", "on", nlohmann::json{{"brightness", 200}}, at("2024-01-01T00:00:00Z"));
        auto b = makeEntityState("light.a", "on", nlohmann::json{{"brightness", 200}}, at("2024-01-01T00:05:00Z"));
        auto c = makeEntityState("light.a", "on", nlohmann::json{{"brightness", 100}}, at("2024-01-01T00:00:00Z"));
        CHECK(sameContent(a, b));
        CHECK_FALSE(sameContent(a, c));
    }

    TEST_CASE("JSON view exposes kind, raw state and typed value") {
        auto stamp  = at("2024-02-03T04:05:06Z");
        auto light  = toJson(makeEntityState("light.a", "on", {}, stamp));
        CHECK(light["entity_id"] == "light.a");
        CHECK(light["kind"] == "on_off");
        CHECK(light["state"] == "on");
        CHECK(light["value"] == true);
        CHECK(light["last_updated"] == "2024-02-03T04:05:06.000Z");

        auto sensor = toJson(makeEntityState("sensor.t", "19.25", {}, stamp));
        CHECK(sensor["kind"] == "numeric");
        CHECK(sensor["value"].get<double>() == doctest::Approx(19.25));

        auto removed = toJson(makeTombstone("sensor.t", stamp));
        CHECK(removed["kind"] == "removed");
        CHECK(removed["value"].is_null());
    }
}
