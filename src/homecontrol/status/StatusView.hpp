#pragma once

#include "entity/EntityCache.hpp"
#include "hardware/HardwareOutputDriver.hpp"
#include "upstream/CommandSink.hpp"
#include "upstream/SyncClient.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HC {

struct StatusViewConfig {
    EntityId              weather_entity{"weather.home"};
    EntityId              location_entity{"zone.home"};
    std::string           location_label;
    std::vector<EntityId> lights;
};

struct WeatherStatus {
    std::string           state;
    std::string           timestamp;
    std::optional<double> temperature;
    std::optional<double> humidity;
    std::optional<double> pressure;
    std::optional<double> wind_speed;
    std::optional<double> wind_bearing;
};

struct LocationStatus {
    std::string           name;
    std::optional<double> latitude;
    std::optional<double> longitude;
};

/**
 * What the UI polls. Every optional that is empty is reported as unknown,
 * which the UI must not confuse with "off" or zero.
 */
struct StatusView {
    bool                                          connected{false};
    Upstream::ConnectionState                     connection{Upstream::ConnectionState::Disconnected};
    std::uint64_t                                 generation{0};
    std::optional<LocationStatus>                 location;
    std::optional<WeatherStatus>                  weather_current;
    std::optional<WeatherStatus>                  weather_forecast;
    std::vector<std::pair<EntityId, std::optional<bool>>> lights;
    std::vector<Hardware::HardwareOutput>         outputs;
    std::optional<Upstream::SyncStats>            upstream;
};

[[nodiscard]] auto buildStatusView(EntityCache::Snapshot const&               snapshot,
                                   Upstream::ConnectionState                  connection,
                                   std::vector<Hardware::HardwareOutput>      outputs,
                                   StatusViewConfig const&                    config) -> StatusView;

[[nodiscard]] auto toJson(StatusView const& view) -> nlohmann::json;

// Reads the live sources; never blocks on upstream I/O.
class StatusViewBuilder {
public:
    StatusViewBuilder(EntityCache const&                              cache,
                      Upstream::SyncClient const*                     sync,
                      std::shared_ptr<Hardware::HardwareOutputDriver> outputs,
                      StatusViewConfig                                config);

    [[nodiscard]] auto build() const -> StatusView;
    [[nodiscard]] auto config() const -> StatusViewConfig const& { return config_; }

private:
    EntityCache const&                              cache_;
    Upstream::SyncClient const*                     sync_;
    std::shared_ptr<Hardware::HardwareOutputDriver> outputs_;
    StatusViewConfig                                config_;
    std::vector<EntityId>                           watched_;
};

} // namespace HC
