#include "status/StatusView.hpp"

#include <utility>

namespace HC {
namespace {

using Json = nlohmann::json;

[[nodiscard]] auto find_live(EntityCache::Snapshot const& snapshot, EntityId const& id) -> EntityStatePtr {
    auto it = snapshot.entities.find(id);
    if (it == snapshot.entities.end() || !it->second || isTombstone(*it->second)) {
        return nullptr;
    }
    return it->second;
}

[[nodiscard]] auto read_number(Json const& object, char const* key) -> std::optional<double> {
    if (!object.is_object()) {
        return std::nullopt;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

[[nodiscard]] auto read_text(Json const& object, char const* key) -> std::string {
    if (!object.is_object()) {
        return {};
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

[[nodiscard]] auto current_weather(EntityState const& state) -> WeatherStatus {
    WeatherStatus weather;
    weather.state        = state.raw_state;
    weather.timestamp    = format_timestamp(state.last_updated);
    weather.temperature  = read_number(state.attributes, "temperature");
    weather.humidity     = read_number(state.attributes, "humidity");
    weather.pressure     = read_number(state.attributes, "pressure");
    weather.wind_speed   = read_number(state.attributes, "wind_speed");
    weather.wind_bearing = read_number(state.attributes, "wind_bearing");
    return weather;
}

[[nodiscard]] auto first_forecast(EntityState const& state) -> std::optional<WeatherStatus> {
    auto it = state.attributes.find("forecast");
    if (it == state.attributes.end() || !it->is_array() || it->empty() || !it->front().is_object()) {
        return std::nullopt;
    }
    auto const&   entry = it->front();
    WeatherStatus forecast;
    forecast.state        = read_text(entry, "condition");
    forecast.timestamp    = read_text(entry, "datetime");
    forecast.temperature  = read_number(entry, "temperature");
    forecast.wind_speed   = read_number(entry, "wind_speed");
    forecast.wind_bearing = read_number(entry, "wind_bearing");
    return forecast;
}

[[nodiscard]] auto unknown() -> Json {
    return Json{{"status", "unknown"}};
}

[[nodiscard]] auto optional_number(std::optional<double> const& value) -> Json {
    return value ? Json(*value) : Json(nullptr);
}

[[nodiscard]] auto weather_json(std::optional<WeatherStatus> const& weather) -> Json {
    if (!weather) {
        return unknown();
    }
    return Json{{"state", weather->state},
                {"timestamp", weather->timestamp},
                {"temperature", optional_number(weather->temperature)},
                {"humidity", optional_number(weather->humidity)},
                {"pressure", optional_number(weather->pressure)},
                {"wind_speed", optional_number(weather->wind_speed)},
                {"wind_bearing", optional_number(weather->wind_bearing)}};
}

} // namespace

auto buildStatusView(EntityCache::Snapshot const&          snapshot,
                     Upstream::ConnectionState             connection,
                     std::vector<Hardware::HardwareOutput> outputs,
                     StatusViewConfig const&               config) -> StatusView {
    StatusView view;
    view.connection = connection;
    view.connected  = connection == Upstream::ConnectionState::Subscribed;
    view.generation = snapshot.generation;
    view.outputs    = std::move(outputs);

    if (auto weather = find_live(snapshot, config.weather_entity)) {
        view.weather_current  = current_weather(*weather);
        view.weather_forecast = first_forecast(*weather);
    }

    auto location_state = find_live(snapshot, config.location_entity);
    if (!config.location_label.empty() || location_state) {
        LocationStatus location;
        location.name = config.location_label;
        if (location_state) {
            if (location.name.empty()) {
                location.name = read_text(location_state->attributes, "friendly_name");
            }
            if (location.name.empty()) {
                location.name = location_state->raw_state;
            }
            location.latitude  = read_number(location_state->attributes, "latitude");
            location.longitude = read_number(location_state->attributes, "longitude");
        }
        view.location = std::move(location);
    }

    view.lights.reserve(config.lights.size());
    for (auto const& id : config.lights) {
        std::optional<bool> value;
        if (auto light = find_live(snapshot, id)) {
            value = asBool(*light);
        }
        view.lights.emplace_back(id, value);
    }
    return view;
}

auto toJson(StatusView const& view) -> nlohmann::json {
    Json json;
    json["connected"]  = view.connected;
    json["connection"] = std::string{Upstream::connectionStateToString(view.connection)};
    json["generation"] = view.generation;

    if (view.location) {
        json["location"] = Json{{"name", view.location->name},
                                {"latitude", optional_number(view.location->latitude)},
                                {"longitude", optional_number(view.location->longitude)}};
    } else {
        json["location"] = unknown();
    }
    json["weather"] = Json{{"current", weather_json(view.weather_current)},
                           {"forecast", weather_json(view.weather_forecast)}};

    auto lights = Json::object();
    for (auto const& [id, value] : view.lights) {
        lights[id] = value ? Json(*value) : Json("unknown");
    }
    json["lights"] = std::move(lights);

    auto outputs = Json::object();
    for (auto const& output : view.outputs) {
        outputs[output.channel_id] = output.is_on;
    }
    json["outputs"] = std::move(outputs);

    if (view.upstream) {
        auto const& stats = *view.upstream;
        json["upstream"]  = Json{{"connection_attempts", stats.connection_attempts},
                                 {"subscriptions", stats.subscriptions},
                                 {"events_applied", stats.events_applied},
                                 {"malformed_events", stats.malformed_events},
                                 {"commands_sent", stats.commands_sent},
                                 {"commands_rejected", stats.commands_rejected},
                                 {"last_error", stats.last_error}};
    } else {
        json["upstream"] = Json{{"configured", false}};
    }
    return json;
}

StatusViewBuilder::StatusViewBuilder(EntityCache const&                              cache,
                                     Upstream::SyncClient const*                     sync,
                                     std::shared_ptr<Hardware::HardwareOutputDriver> outputs,
                                     StatusViewConfig                                config)
    : cache_(cache)
    , sync_(sync)
    , outputs_(std::move(outputs))
    , config_(std::move(config)) {
    watched_.reserve(config_.lights.size() + 2);
    watched_.push_back(config_.weather_entity);
    watched_.push_back(config_.location_entity);
    watched_.insert(watched_.end(), config_.lights.begin(), config_.lights.end());
}

auto StatusViewBuilder::build() const -> StatusView {
    auto connection = sync_ ? sync_->connectionState() : Upstream::ConnectionState::Disconnected;
    auto outputs    = outputs_ ? outputs_->channels() : std::vector<Hardware::HardwareOutput>{};
    auto view       = buildStatusView(cache_.select(watched_), connection, std::move(outputs), config_);
    if (sync_) {
        view.upstream = sync_->stats();
    }
    return view;
}

} // namespace HC
