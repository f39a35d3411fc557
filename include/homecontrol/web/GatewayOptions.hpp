#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HC::Web {

struct GatewayOptions {
    std::string              host{"127.0.0.1"};
    int                      port{8000};
    std::string              upstream_url;
    std::string              access_token;
    std::string              ca_cert_path;
    bool                     verify_tls{true};
    std::string              reverse_proxy_url;
    std::string              location_entity{"zone.home"};
    std::string              location_label;
    std::string              weather_entity{"weather.home"};
    std::vector<std::string> lights;
    int                      red_led_pin{17};
    int                      green_led_pin{27};
    int                      buzzer_pin{18};
    bool                     simulate_gpio{true};
    std::int64_t             command_timeout_ms{5000};
    std::int64_t             backoff_initial_ms{500};
    std::int64_t             backoff_max_ms{30000};
    std::int64_t             backoff_stable_ms{10000};
    std::int64_t             heartbeat_ms{15000};
    std::int64_t             idle_timeout_ms{45000};
    bool                     log_debug{false};
    bool                     quiet{false};
    bool                     show_help{false};
};

// Defaults, including whether this build can drive GPIO pins.
auto DefaultGatewayOptions() -> GatewayOptions;

auto ParseGatewayArguments(int argc, char** argv) -> std::optional<GatewayOptions>;

void PrintGatewayUsage();

bool ApplyGatewayEnvOverrides(GatewayOptions& options);

auto ValidateGatewayOptions(GatewayOptions const& options) -> std::optional<std::string>;

bool IsValidGatewayPort(int port);
bool IsValidUpstreamUrl(std::string_view url);
bool IsValidProxyUrl(std::string_view url);

} // namespace HC::Web
