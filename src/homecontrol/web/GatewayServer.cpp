#define CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"

#include <homecontrol/web/GatewayServer.hpp>

#include "dispatch/CommandDispatcher.hpp"
#include "entity/EntityCache.hpp"
#include "hardware/OutputDriverFactory.hpp"
#include "log/TaggedLogger.hpp"
#include "status/StatusView.hpp"
#include "upstream/SyncClient.hpp"
#include "upstream/UpstreamSession.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace HC::Web {

static std::atomic<bool> g_should_stop{false};

namespace {

auto make_output_channels(GatewayOptions const& options) -> std::vector<Hardware::OutputChannelConfig> {
    return {
        Hardware::OutputChannelConfig{"red_led", static_cast<std::uint32_t>(options.red_led_pin)},
        Hardware::OutputChannelConfig{"green_led", static_cast<std::uint32_t>(options.green_led_pin)},
        Hardware::OutputChannelConfig{"buzzer", static_cast<std::uint32_t>(options.buzzer_pin)},
    };
}

auto make_sync_options(GatewayOptions const& options) -> Upstream::SyncClientOptions {
    Upstream::SyncClientOptions sync;
    sync.upstream.url          = options.upstream_url;
    sync.upstream.access_token = options.access_token;
    sync.upstream.ca_cert_path = options.ca_cert_path;
    sync.upstream.verify_tls   = options.verify_tls;
    sync.backoff.initial       = std::chrono::milliseconds{options.backoff_initial_ms};
    sync.backoff.maximum       = std::chrono::milliseconds{options.backoff_max_ms};
    sync.backoff.stable        = std::chrono::milliseconds{options.backoff_stable_ms};
    sync.heartbeat_interval    = std::chrono::milliseconds{options.heartbeat_ms};
    sync.idle_timeout          = std::chrono::milliseconds{options.idle_timeout_ms};
    return sync;
}

auto make_status_config(GatewayOptions const& options) -> StatusViewConfig {
    StatusViewConfig config;
    config.weather_entity  = options.weather_entity;
    config.location_entity = options.location_entity;
    config.location_label  = options.location_label;
    config.lights          = options.lights;
    return config;
}

} // namespace

void RequestGatewayStop() {
    g_should_stop.store(true);
}

void ResetGatewayStopFlag() {
    g_should_stop.store(false);
}

auto RegisterGatewayRoutes(httplib::Server& server, HttpRequestContext& ctx) -> GatewayControllers {
    GatewayControllers controllers;
    controllers.api = ApiController::Create(ctx);
    controllers.api->register_routes(server);
    controllers.proxy = ProxyController::Create(ctx);
    controllers.proxy->register_routes(server);
    return controllers;
}

int RunGatewayWithStopFlag(GatewayOptions const&                             options,
                           std::atomic<bool>&                                should_stop,
                           GatewayLogHooks const&                            log_hooks,
                           std::function<void(Expected<void>)>               on_listen,
                           std::shared_ptr<Upstream::UpstreamSessionFactory> upstream_factory) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    auto outputs = Hardware::makeOutputDriver(Hardware::OutputDriverOptions{
        .channels = make_output_channels(options),
        .simulate = options.simulate_gpio,
    });
    if (!outputs) {
        log_error("[gateway] Failed to open outputs: " + describeError(outputs.error()));
        report_listen_status(std::unexpected(outputs.error()));
        return EXIT_FAILURE;
    }

    EntityCache                           cache;
    std::unique_ptr<Upstream::SyncClient> sync;
    if (!options.upstream_url.empty()) {
        if (!upstream_factory) {
            upstream_factory = Upstream::makeWebSocketSessionFactory();
        }
        sync = std::make_unique<Upstream::SyncClient>(cache, upstream_factory, make_sync_options(options));
        sync->start();
        log_info("[gateway] Syncing with " + options.upstream_url);
    } else {
        log_info("[gateway] No upstream configured; serving local outputs only");
    }

    CommandDispatcher dispatcher{cache,
                                 *outputs,
                                 sync.get(),
                                 DispatcherOptions{std::chrono::milliseconds{options.command_timeout_ms}}};
    StatusViewBuilder status{cache, sync.get(), *outputs, make_status_config(options)};

    HttpRequestContext http_context{
        .options    = options,
        .cache      = cache,
        .dispatcher = dispatcher,
        .status     = status,
        .outputs    = **outputs,
    };

    httplib::Server server;
    auto            controllers = RegisterGatewayRoutes(server, http_context);

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
#if !defined(HC_LOG_DISABLED)
        set_thread_name("HttpServer");
#endif
        if (!server.listen(options.host.c_str(), options.port)) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                log_error(std::string{"[gateway] Failed to bind "} + options.host + ":"
                          + std::to_string(options.port));
            }
        }
    });

    log_info(std::string{"[gateway] Listening on http://"} + options.host + ":" + std::to_string(options.port));

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported.load(std::memory_order_acquire) && server.is_running()) {
            report_listen_status({});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!listen_reported.load(std::memory_order_acquire)) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::TransportFailure, "failed to bind gateway listener"}));
        } else {
            report_listen_status(std::unexpected(Error{Error::Code::UnknownError, "gateway stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }
    if (sync) {
        sync->stop();
    }
    log_info("[gateway] Stopped");

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunGateway(GatewayOptions const& options) {
    return RunGatewayWithStopFlag(options, g_should_stop, {}, {});
}

} // namespace HC::Web
