#include "status/StatusView.hpp"
#include "hardware/OutputDriverFactory.hpp"
#include "hardware/SimulatedOutputDriver.hpp"
#include "upstream/UpstreamLoopback.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <thread>

using namespace HC;
using namespace std::chrono_literals;

namespace {

auto at(int seconds) -> Timestamp {
    return Timestamp{} + std::chrono::hours{24 * 365 * 54} + std::chrono::seconds{seconds};
}

auto weather_attributes() -> nlohmann::json {
    return nlohmann::json{
        {"temperature", 18.5},
        {"humidity", 64},
        {"pressure", 1012.0},
        {"wind_speed", 3.2},
        {"wind_bearing", 270},
        {"forecast",
         nlohmann::json::array({nlohmann::json{{"condition", "rainy"},
                                               {"datetime", "2024-06-02T12:00:00+00:00"},
                                               {"temperature", 15.0}}})}};
}

auto config_with_lights() -> StatusViewConfig {
    StatusViewConfig config;
    config.lights = {"light.kitchen", "light.hall", "light.garden"};
    return config;
}

} // namespace

TEST_SUITE("status.view") {
    TEST_CASE("Empty cache reports everything unknown") {
        EntityCache cache;
        auto        view = buildStatusView(cache.snapshot(), Upstream::ConnectionState::Disconnected, {}, config_with_lights());
        CHECK_FALSE(view.connected);
        CHECK_FALSE(view.location.has_value());
        CHECK_FALSE(view.weather_current.has_value());
        CHECK_FALSE(view.weather_forecast.has_value());
        REQUIRE(view.lights.size() == 3);
        for (auto const& [id, value] : view.lights) {
            CHECK_FALSE(value.has_value());
        }

        auto json = toJson(view);
        CHECK(json["connection"] == "disconnected");
        CHECK(json["location"]["status"] == "unknown");
        CHECK(json["weather"]["current"]["status"] == "unknown");
        CHECK(json["weather"]["forecast"]["status"] == "unknown");
        CHECK(json["lights"]["light.kitchen"] == "unknown");
        CHECK(json["upstream"]["configured"] == false);
    }

    TEST_CASE("Weather, forecast and location are composed from entities") {
        EntityCache cache;
        cache.apply(makeEntityState("weather.home", "cloudy", weather_attributes(), at(1)));
        cache.apply(makeEntityState("zone.home", "zoning",
                                    nlohmann::json{{"friendly_name", "Home"}, {"latitude", 59.3}, {"longitude", 18.1}},
                                    at(1)));

        auto view = buildStatusView(cache.snapshot(), Upstream::ConnectionState::Subscribed, {}, StatusViewConfig{});
        CHECK(view.connected);
        REQUIRE(view.weather_current.has_value());
        CHECK(view.weather_current->state == "cloudy");
        CHECK(view.weather_current->temperature == std::optional<double>{18.5});
        CHECK(view.weather_current->humidity == std::optional<double>{64.0});
        REQUIRE(view.weather_forecast.has_value());
        CHECK(view.weather_forecast->state == "rainy");
        CHECK(view.weather_forecast->timestamp == "2024-06-02T12:00:00+00:00");
        CHECK_FALSE(view.weather_forecast->humidity.has_value());

        REQUIRE(view.location.has_value());
        CHECK(view.location->name == "Home");
        CHECK(view.location->latitude == std::optional<double>{59.3});

        auto json = toJson(view);
        CHECK(json["weather"]["current"]["wind_bearing"] == 270.0);
        CHECK(json["weather"]["forecast"]["humidity"].is_null());
        CHECK(json["location"]["name"] == "Home");
    }

    TEST_CASE("A configured label wins over the entity name") {
        EntityCache cache;
        StatusViewConfig config;
        config.location_label = "Cabin";
        auto view = buildStatusView(cache.snapshot(), Upstream::ConnectionState::Disconnected, {}, config);
        REQUIRE(view.location.has_value());
        CHECK(view.location->name == "Cabin");
        CHECK_FALSE(view.location->latitude.has_value());
    }

    TEST_CASE("Empty forecasts and removed entities surface as unknown") {
        EntityCache cache;
        auto        attributes = weather_attributes();
        attributes["forecast"] = nlohmann::json::array();
        cache.apply(makeEntityState("weather.home", "sunny", attributes, at(1)));
        cache.apply(makeEntityState("light.kitchen", "on", {}, at(1)));
        cache.apply(makeTombstone("light.kitchen", at(2)));
        cache.apply(makeEntityState("light.hall", "unavailable", {}, at(1)));

        auto view = buildStatusView(cache.snapshot(), Upstream::ConnectionState::Subscribed, {}, config_with_lights());
        CHECK(view.weather_current.has_value());
        CHECK_FALSE(view.weather_forecast.has_value());
        auto json = toJson(view);
        CHECK(json["lights"]["light.kitchen"] == "unknown");
        CHECK(json["lights"]["light.hall"] == "unknown");
    }

    TEST_CASE("Lights and outputs are reported by value") {
        EntityCache cache;
        cache.apply(makeEntityState("light.kitchen", "on", {}, at(1)));
        cache.apply(makeEntityState("light.hall", "off", {}, at(1)));
        std::vector<Hardware::HardwareOutput> outputs{{"red_led", true}, {"green_led", false}};

        auto json = toJson(buildStatusView(cache.snapshot(), Upstream::ConnectionState::Subscribed, outputs,
                                           config_with_lights()));
        CHECK(json["lights"]["light.kitchen"] == true);
        CHECK(json["lights"]["light.hall"] == false);
        CHECK(json["outputs"]["red_led"] == true);
        CHECK(json["outputs"]["green_led"] == false);
        CHECK(json["generation"] == 2);
    }

    TEST_CASE("Builder reads only the watched entities") {
        EntityCache cache;
        cache.apply(makeEntityState("light.kitchen", "on", nlohmann::json::object(), at(1)));
        cache.apply(makeEntityState("sensor.unrelated", "42", nlohmann::json::object(), at(1)));
        cache.apply(makeEntityState("weather.home", "sunny", weather_attributes(), at(2)));

        StatusViewBuilder builder{cache, nullptr, nullptr, config_with_lights()};
        auto              view = builder.build();
        CHECK(view.generation == cache.generation());
        CHECK_FALSE(view.connected);
        REQUIRE(view.weather_current.has_value());
        CHECK(view.weather_current->state == "sunny");
        REQUIRE(view.lights.size() == 3);
        CHECK(view.lights[0].second == std::optional<bool>{true});
        CHECK_FALSE(view.lights[1].second.has_value());
        CHECK(view.outputs.empty());
        CHECK_FALSE(view.upstream.has_value());
    }

    TEST_CASE("Builder keeps stale values and outputs across an outage") {
        auto hub = std::make_shared<Upstream::Loopback::Hub>();
        hub->setEntity("light.kitchen", "on");

        EntityCache                 cache;
        Upstream::SyncClientOptions options;
        options.upstream.url          = "ws://loopback/api/websocket";
        options.upstream.access_token = "loopback-token";
        options.backoff               = Upstream::BackoffPolicy{20ms, 100ms, 10s};
        options.receive_poll          = 10ms;
        Upstream::SyncClient client{cache, Upstream::Loopback::makeFactory(hub), options};

        auto outputs = std::make_shared<Hardware::SimulatedOutputDriver>(Hardware::defaultOutputChannels());
        StatusViewBuilder builder{cache, &client, outputs, config_with_lights()};

        client.start();
        REQUIRE(client.waitForState(Upstream::ConnectionState::Subscribed, 3000ms));
        REQUIRE(outputs->write("red_led", true).has_value());

        auto connected = toJson(builder.build());
        CHECK(connected["connected"] == true);
        CHECK(connected["lights"]["light.kitchen"] == true);
        CHECK(connected["upstream"]["subscriptions"] == 1);

        hub->setRefuseConnections(true);
        hub->dropConnections();
        auto deadline = std::chrono::steady_clock::now() + 3s;
        while (client.connectionState() == Upstream::ConnectionState::Subscribed
               && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }

        auto stale = toJson(builder.build());
        CHECK(stale["connected"] == false);
        CHECK(stale["lights"]["light.kitchen"] == true);
        CHECK(stale["outputs"]["red_led"] == true);

        hub->setRefuseConnections(false);
        REQUIRE(client.waitForState(Upstream::ConnectionState::Subscribed, 3000ms));
        auto restored = toJson(builder.build());
        CHECK(restored["connected"] == true);
        CHECK(restored["outputs"]["red_led"] == true);
        client.stop();
    }
}
