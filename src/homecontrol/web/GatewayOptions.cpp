#include <homecontrol/web/GatewayOptions.hpp>

#include "entity/EntityState.hpp"
#include "hardware/OutputDriverFactory.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace HC::Web {

namespace {

constexpr int kMaxPin = 63;

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> items;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item  = text.substr(0, comma);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front())) != 0) {
            item.remove_prefix(1);
        }
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())) != 0) {
            item.remove_suffix(1);
        }
        if (!item.empty()) {
            items.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return items;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

// Shared by the env and flag paths; `name` is the env key or the flag.
bool assign_positive_ms(std::string_view name, std::string_view value, std::int64_t& target) {
    std::int64_t parsed = target;
    if (!parse_integer_in_range<std::int64_t>(value, 1, std::numeric_limits<std::int32_t>::max(), parsed)) {
        std::cerr << name << " must be a positive number of milliseconds\n";
        return false;
    }
    target = parsed;
    return true;
}

bool assign_pin(std::string_view name, std::string_view value, int& target) {
    int parsed = target;
    if (!parse_integer_in_range<int>(value, 0, kMaxPin, parsed)) {
        std::cerr << name << " must be within 0-" << kMaxPin << "\n";
        return false;
    }
    target = parsed;
    return true;
}

bool assign_entity(std::string_view name, std::string_view value, std::string& target) {
    if (!isValidEntityId(value)) {
        std::cerr << name << " must be an entity id (domain.object_id)\n";
        return false;
    }
    target = std::string{value};
    return true;
}

} // namespace

auto DefaultGatewayOptions() -> GatewayOptions {
    GatewayOptions options{};
    options.simulate_gpio = !Hardware::gpioSupported();
    return options;
}

bool IsValidGatewayPort(int port) {
    return port > 0 && port <= 65535;
}

bool IsValidUpstreamUrl(std::string_view url) {
    auto rest = url.starts_with("wss://") ? url.substr(6) : url.starts_with("ws://") ? url.substr(5) : std::string_view{};
    return !rest.empty() && rest.front() != '/' && rest.front() != ':';
}

bool IsValidProxyUrl(std::string_view url) {
    auto rest = url.starts_with("https://") ? url.substr(8)
                : url.starts_with("http://") ? url.substr(7)
                                              : std::string_view{};
    return !rest.empty() && rest.front() != '/' && rest.front() != ':';
}

auto ValidateGatewayOptions(GatewayOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidGatewayPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (!options.upstream_url.empty() && !IsValidUpstreamUrl(options.upstream_url)) {
        return std::string{"--upstream-url must be a ws:// or wss:// URL"};
    }
    if (!options.upstream_url.empty() && options.access_token.empty()) {
        return std::string{"--upstream-url requires --access-token"};
    }
    if (!options.reverse_proxy_url.empty() && !IsValidProxyUrl(options.reverse_proxy_url)) {
        return std::string{"--reverse-proxy-url must be an http(s) URL"};
    }
    if (!isValidEntityId(options.location_entity)) {
        return std::string{"--location-entity must be an entity id (domain.object_id)"};
    }
    if (!isValidEntityId(options.weather_entity)) {
        return std::string{"--weather-entity must be an entity id (domain.object_id)"};
    }
    for (auto const& light : options.lights) {
        if (!isValidEntityId(light)) {
            return std::string{"--light must be an entity id (domain.object_id): " + light};
        }
    }
    for (int pin : {options.red_led_pin, options.green_led_pin, options.buzzer_pin}) {
        if (pin < 0 || pin > kMaxPin) {
            return std::string{"GPIO pins must be within 0-63"};
        }
    }
    if (std::set<int>{options.red_led_pin, options.green_led_pin, options.buzzer_pin}.size() != 3) {
        return std::string{"GPIO pins must be distinct"};
    }
    if (!options.simulate_gpio && !Hardware::gpioSupported()) {
        return std::string{"this build has no GPIO support; use --simulate-gpio"};
    }
    if (options.command_timeout_ms <= 0) {
        return std::string{"--command-timeout-ms must be > 0"};
    }
    if (options.backoff_initial_ms <= 0) {
        return std::string{"--backoff-initial-ms must be > 0"};
    }
    if (options.backoff_max_ms < options.backoff_initial_ms) {
        return std::string{"--backoff-max-ms must be >= --backoff-initial-ms"};
    }
    if (options.backoff_stable_ms <= 0) {
        return std::string{"--backoff-stable-ms must be > 0"};
    }
    if (options.heartbeat_ms <= 0 || options.idle_timeout_ms <= 0) {
        return std::string{"--heartbeat-ms and --idle-timeout-ms must be > 0"};
    }
    return std::nullopt;
}

bool ApplyGatewayEnvOverrides(GatewayOptions& options) {
    if (!apply_env("HOMECONTROL_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "HOMECONTROL_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "HOMECONTROL_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_UPSTREAM_URL", [&](std::string_view value) {
            if (!value.empty() && !IsValidUpstreamUrl(value)) {
                std::cerr << "HOMECONTROL_UPSTREAM_URL must be a ws:// or wss:// URL\n";
                return false;
            }
            options.upstream_url = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_ACCESS_TOKEN", [&](std::string_view value) {
            options.access_token = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_CA_CERT", [&](std::string_view value) {
            options.ca_cert_path = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_REVERSE_PROXY_URL", [&](std::string_view value) {
            if (!value.empty() && !IsValidProxyUrl(value)) {
                std::cerr << "HOMECONTROL_REVERSE_PROXY_URL must be an http(s) URL\n";
                return false;
            }
            options.reverse_proxy_url = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_LOCATION_ENTITY", [&](std::string_view value) {
            return assign_entity("HOMECONTROL_LOCATION_ENTITY", value, options.location_entity);
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_LOCATION", [&](std::string_view value) {
            options.location_label = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_WEATHER_ENTITY", [&](std::string_view value) {
            return assign_entity("HOMECONTROL_WEATHER_ENTITY", value, options.weather_entity);
        })) {
        return false;
    }

    if (!apply_env("HOMECONTROL_LIGHTS", [&](std::string_view value) {
            auto lights = split_list(value);
            for (auto const& light : lights) {
                if (!isValidEntityId(light)) {
                    std::cerr << "HOMECONTROL_LIGHTS entries must be entity ids: " << light << "\n";
                    return false;
                }
            }
            options.lights = std::move(lights);
            return true;
        })) {
        return false;
    }

    auto apply_pin_env = [&](char const* key, int& target) {
        return apply_env(key, [&](std::string_view value) { return assign_pin(key, value, target); });
    };
    if (!apply_pin_env("HOMECONTROL_RED_LED_PIN", options.red_led_pin)
        || !apply_pin_env("HOMECONTROL_GREEN_LED_PIN", options.green_led_pin)
        || !apply_pin_env("HOMECONTROL_BUZZER_PIN", options.buzzer_pin)) {
        return false;
    }

    auto apply_ms_env = [&](char const* key, std::int64_t& target) {
        return apply_env(key, [&](std::string_view value) { return assign_positive_ms(key, value, target); });
    };
    if (!apply_ms_env("HOMECONTROL_COMMAND_TIMEOUT_MS", options.command_timeout_ms)
        || !apply_ms_env("HOMECONTROL_BACKOFF_INITIAL_MS", options.backoff_initial_ms)
        || !apply_ms_env("HOMECONTROL_BACKOFF_MAX_MS", options.backoff_max_ms)
        || !apply_ms_env("HOMECONTROL_BACKOFF_STABLE_MS", options.backoff_stable_ms)
        || !apply_ms_env("HOMECONTROL_HEARTBEAT_MS", options.heartbeat_ms)
        || !apply_ms_env("HOMECONTROL_IDLE_TIMEOUT_MS", options.idle_timeout_ms)) {
        return false;
    }

    auto apply_bool_env = [&](char const* key, bool& target) {
        return apply_env(key, [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << key << " must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            target = *parsed;
            return true;
        });
    };

    bool insecure = !options.verify_tls;
    if (!apply_bool_env("HOMECONTROL_INSECURE_TLS", insecure)) {
        return false;
    }
    options.verify_tls = !insecure;

    if (!apply_bool_env("HOMECONTROL_SIMULATE_GPIO", options.simulate_gpio)) {
        return false;
    }
    if (!apply_bool_env("HOMECONTROL_LOG_DEBUG", options.log_debug)) {
        return false;
    }
    bool logging = !options.quiet;
    if (!apply_bool_env("HOMECONTROL_LOG", logging)) {
        return false;
    }
    options.quiet = !logging;
    return true;
}

void PrintGatewayUsage() {
    std::cout << "Usage: homecontrol_gateway [options]\n"
              << "  --host <host>                 Bind address (default 127.0.0.1)\n"
              << "  --port <port>                 Bind port (default 8000)\n"
              << "  --upstream-url <url>          Source WebSocket API, ws:// or wss://host[:port]/api/websocket\n"
              << "  --access-token <token>        Long-lived access token for the source\n"
              << "  --ca-cert <path>              CA bundle used to verify wss:// peers\n"
              << "  --insecure-tls                Skip certificate verification for wss://\n"
              << "  --reverse-proxy-url <url>     Relay unmodeled requests to this http(s) base URL\n"
              << "  --location-entity <id>        Entity describing the location (default zone.home)\n"
              << "  --location <label>            Location label shown in the status view\n"
              << "  --weather-entity <id>         Weather entity (default weather.home)\n"
              << "  --light <id>                  Light reported in the status view (repeatable)\n"
              << "  --red-led-pin <n>             GPIO pin of the red LED (default 17)\n"
              << "  --green-led-pin <n>           GPIO pin of the green LED (default 27)\n"
              << "  --buzzer-pin <n>              GPIO pin of the buzzer (default 18)\n"
              << "  --simulate-gpio               Use in-memory outputs instead of GPIO\n"
              << "  --command-timeout-ms <ms>     Bound on acknowledgment plus confirmation (default 5000)\n"
              << "  --backoff-initial-ms <ms>     First reconnect delay (default 500)\n"
              << "  --backoff-max-ms <ms>         Reconnect delay cap (default 30000)\n"
              << "  --backoff-stable-ms <ms>      Subscription time before the delay resets (default 10000)\n"
              << "  --heartbeat-ms <ms>           Ping interval on a quiet connection (default 15000)\n"
              << "  --idle-timeout-ms <ms>        Reconnect after this much inbound silence (default 45000)\n"
              << "  --log-debug                   Include DEBUG log lines\n"
              << "  --quiet                       Disable logging\n"
              << "  --help                        Show this help\n";
}

std::optional<GatewayOptions> ParseGatewayArguments(int argc, char** argv) {
    GatewayOptions options = DefaultGatewayOptions();
    if (!ApplyGatewayEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    bool lights_from_flags = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--upstream-url") {
            if (auto value = require_value(i, "--upstream-url")) {
                if (!IsValidUpstreamUrl(*value)) {
                    std::cerr << "--upstream-url must be a ws:// or wss:// URL\n";
                    return std::nullopt;
                }
                options.upstream_url = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--access-token") {
            if (auto value = require_value(i, "--access-token")) {
                options.access_token = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--ca-cert") {
            if (auto value = require_value(i, "--ca-cert")) {
                options.ca_cert_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--reverse-proxy-url") {
            if (auto value = require_value(i, "--reverse-proxy-url")) {
                if (!IsValidProxyUrl(*value)) {
                    std::cerr << "--reverse-proxy-url must be an http(s) URL\n";
                    return std::nullopt;
                }
                options.reverse_proxy_url = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--location-entity") {
            auto value = require_value(i, "--location-entity");
            if (!value || !assign_entity("--location-entity", *value, options.location_entity)) {
                return std::nullopt;
            }
        } else if (arg == "--location") {
            if (auto value = require_value(i, "--location")) {
                options.location_label = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--weather-entity") {
            auto value = require_value(i, "--weather-entity");
            if (!value || !assign_entity("--weather-entity", *value, options.weather_entity)) {
                return std::nullopt;
            }
        } else if (arg == "--light") {
            auto value = require_value(i, "--light");
            if (!value) {
                return std::nullopt;
            }
            if (!isValidEntityId(*value)) {
                std::cerr << "--light must be an entity id (domain.object_id)\n";
                return std::nullopt;
            }
            if (!lights_from_flags) {
                options.lights.clear();
                lights_from_flags = true;
            }
            options.lights.emplace_back(*value);
        } else if (arg == "--red-led-pin" || arg == "--green-led-pin" || arg == "--buzzer-pin") {
            auto value = require_value(i, arg);
            int& target = arg == "--red-led-pin"     ? options.red_led_pin
                          : arg == "--green-led-pin" ? options.green_led_pin
                                                     : options.buzzer_pin;
            if (!value || !assign_pin(arg, *value, target)) {
                return std::nullopt;
            }
        } else if (arg == "--command-timeout-ms" || arg == "--backoff-initial-ms" || arg == "--backoff-max-ms"
                   || arg == "--backoff-stable-ms" || arg == "--heartbeat-ms" || arg == "--idle-timeout-ms") {
            auto          value  = require_value(i, arg);
            std::int64_t& target = arg == "--command-timeout-ms"   ? options.command_timeout_ms
                                   : arg == "--backoff-initial-ms" ? options.backoff_initial_ms
                                   : arg == "--backoff-max-ms"     ? options.backoff_max_ms
                                   : arg == "--backoff-stable-ms"  ? options.backoff_stable_ms
                                   : arg == "--heartbeat-ms"       ? options.heartbeat_ms
                                                                   : options.idle_timeout_ms;
            if (!value || !assign_positive_ms(arg, *value, target)) {
                return std::nullopt;
            }
        } else if (arg == "--insecure-tls") {
            options.verify_tls = false;
        } else if (arg == "--simulate-gpio") {
            options.simulate_gpio = true;
        } else if (arg == "--log-debug") {
            options.log_debug = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.show_help) {
        return options;
    }

    if (auto error = ValidateGatewayOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace HC::Web
