#pragma once

#include <homecontrol/core/Error.hpp>
#include <homecontrol/web/GatewayOptions.hpp>
#include <homecontrol/web/gateway/routing/ApiController.hpp>
#include <homecontrol/web/gateway/routing/HttpHelpers.hpp>
#include <homecontrol/web/gateway/routing/ProxyController.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string_view>

namespace httplib {
class Server;
}

namespace HC::Upstream {
class UpstreamSessionFactory;
}

namespace HC::Web {

struct GatewayLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

struct GatewayControllers {
    std::unique_ptr<ApiController>   api;
    std::unique_ptr<ProxyController> proxy;
};

// API routes first, then the relay catch-all. Keep the result alive as long as `server`.
auto RegisterGatewayRoutes(httplib::Server& server, HttpRequestContext& ctx) -> GatewayControllers;

int RunGateway(GatewayOptions const& options);

/**
 * Builds the cache, outputs, sync client and dispatcher, then serves HTTP
 * until `should_stop` is raised. `upstream_factory` replaces the WebSocket
 * transport when set.
 */
int RunGatewayWithStopFlag(GatewayOptions const&                            options,
                           std::atomic<bool>&                               should_stop,
                           GatewayLogHooks const&                           log_hooks        = {},
                           std::function<void(Expected<void>)>              on_listen        = {},
                           std::shared_ptr<Upstream::UpstreamSessionFactory> upstream_factory = nullptr);

void RequestGatewayStop();
void ResetGatewayStopFlag();

} // namespace HC::Web
