#include <homecontrol/web/GatewayOptions.hpp>

#include <doctest/doctest.h>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

} // namespace

TEST_CASE("GatewayOptions validation helpers guard ranges") {
    CHECK(HC::Web::IsValidGatewayPort(80));
    CHECK_FALSE(HC::Web::IsValidGatewayPort(0));
    CHECK_FALSE(HC::Web::IsValidGatewayPort(65536));
    CHECK(HC::Web::IsValidUpstreamUrl("ws://hub.local:8123/api/websocket"));
    CHECK(HC::Web::IsValidUpstreamUrl("wss://hub.example.com/api/websocket"));
    CHECK_FALSE(HC::Web::IsValidUpstreamUrl("http://hub.local:8123"));
    CHECK_FALSE(HC::Web::IsValidUpstreamUrl("ws://"));
    CHECK(HC::Web::IsValidProxyUrl("http://127.0.0.1:9000"));
    CHECK_FALSE(HC::Web::IsValidProxyUrl("ftp://127.0.0.1"));
}

TEST_CASE("GatewayOptions Validate detects invalid combinations") {
    HC::Web::GatewayOptions options{};
    options.port = 70000;
    auto error   = HC::Web::ValidateGatewayOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--port") != std::string::npos);

    options.port         = 8000;
    options.upstream_url = "ws://hub.local:8123/api/websocket";
    error                = HC::Web::ValidateGatewayOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--access-token") != std::string::npos);

    options.access_token = "token";
    options.lights       = {"light.kitchen", "kitchen"};
    error                = HC::Web::ValidateGatewayOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--light") != std::string::npos);

    options.lights        = {"light.kitchen"};
    options.green_led_pin = options.red_led_pin;
    error                 = HC::Web::ValidateGatewayOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("distinct") != std::string::npos);

    options.green_led_pin  = 27;
    options.backoff_max_ms = options.backoff_initial_ms - 1;
    error                  = HC::Web::ValidateGatewayOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--backoff-max-ms") != std::string::npos);

    options.backoff_max_ms = 30000;
    CHECK_FALSE(HC::Web::ValidateGatewayOptions(options).has_value());
}

TEST_CASE("Environment overrides apply to CLI defaults") {
    EnvGuard host{"HOMECONTROL_HOST", "0.0.0.0"};
    EnvGuard port{"HOMECONTROL_PORT", "9100"};
    EnvGuard upstream{"HOMECONTROL_UPSTREAM_URL", "ws://hub.local:8123/api/websocket"};
    EnvGuard token{"HOMECONTROL_ACCESS_TOKEN", "secret"};
    EnvGuard lights{"HOMECONTROL_LIGHTS", "light.kitchen, light.hall ,"};
    EnvGuard location{"HOMECONTROL_LOCATION", "Cabin"};
    EnvGuard insecure{"HOMECONTROL_INSECURE_TLS", "yes"};
    EnvGuard timeout{"HOMECONTROL_COMMAND_TIMEOUT_MS", "2500"};

    ArgvBuilder args{"homecontrol_gateway"};
    auto        parsed = HC::Web::ParseGatewayArguments(args.argc(), args.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9100);
    CHECK(parsed->upstream_url == "ws://hub.local:8123/api/websocket");
    CHECK(parsed->access_token == "secret");
    CHECK(parsed->lights == std::vector<std::string>{"light.kitchen", "light.hall"});
    CHECK(parsed->location_label == "Cabin");
    CHECK_FALSE(parsed->verify_tls);
    CHECK(parsed->command_timeout_ms == 2500);
}

TEST_CASE("CLI flags override environment values") {
    EnvGuard port{"HOMECONTROL_PORT", "9100"};
    EnvGuard lights{"HOMECONTROL_LIGHTS", "light.kitchen,light.hall"};

    ArgvBuilder args{"homecontrol_gateway", "--port", "9200", "--light", "light.porch", "--light", "light.garden",
                     "--simulate-gpio", "--quiet"};
    auto        parsed = HC::Web::ParseGatewayArguments(args.argc(), args.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->port == 9200);
    CHECK(parsed->lights == std::vector<std::string>{"light.porch", "light.garden"});
    CHECK(parsed->simulate_gpio);
    CHECK(parsed->quiet);
}

TEST_CASE("Invalid environment values are rejected") {
    SUBCASE("port") {
        EnvGuard    port{"HOMECONTROL_PORT", "not-a-port"};
        ArgvBuilder args{"homecontrol_gateway"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("lights") {
        EnvGuard    lights{"HOMECONTROL_LIGHTS", "light.kitchen,Kitchen Lamp"};
        ArgvBuilder args{"homecontrol_gateway"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("boolean") {
        EnvGuard    simulate{"HOMECONTROL_SIMULATE_GPIO", "maybe"};
        ArgvBuilder args{"homecontrol_gateway"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
}

TEST_CASE("Invalid CLI arguments are rejected") {
    SUBCASE("unknown flag") {
        ArgvBuilder args{"homecontrol_gateway", "--frobnicate"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("missing value") {
        ArgvBuilder args{"homecontrol_gateway", "--port"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("http upstream") {
        ArgvBuilder args{"homecontrol_gateway", "--upstream-url", "http://hub.local:8123"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("pin out of range") {
        ArgvBuilder args{"homecontrol_gateway", "--buzzer-pin", "64"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("zero timeout") {
        ArgvBuilder args{"homecontrol_gateway", "--command-timeout-ms", "0"};
        CHECK_FALSE(HC::Web::ParseGatewayArguments(args.argc(), args.argv()).has_value());
    }
}

TEST_CASE("Help short-circuits validation") {
    ArgvBuilder args{"homecontrol_gateway", "--help", "--port", "0"};
    auto        parsed = HC::Web::ParseGatewayArguments(args.argc(), args.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->show_help);
}
