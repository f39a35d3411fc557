#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <homecontrol/web/gateway/routing/ApiController.hpp>

#include <homecontrol/web/gateway/routing/HttpHelpers.hpp>

#include "dispatch/CommandDispatcher.hpp"
#include "entity/EntityCache.hpp"
#include "hardware/HardwareOutputDriver.hpp"
#include "log/TaggedLogger.hpp"
#include "status/StatusView.hpp"

#include "httplib.h"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace HC::Web {

namespace {

struct ChannelAlias {
    char const* path;
    char const* channel_id;
};

constexpr ChannelAlias kLegacyAliases[] = {
    {"/api/v1/led/red", "red_led"},
    {"/api/v1/led/green", "green_led"},
    {"/api/v1/buzzer", "buzzer"},
};

auto dispatch_result_json(DispatchResult const& result) -> nlohmann::json {
    return nlohmann::json{{"target", result.target},
                          {"kind", targetKindToString(result.kind)},
                          {"state", result.state},
                          {"generation", result.generation},
                          {"changed", result.changed}};
}

} // namespace

auto ApiController::Create(HttpRequestContext& ctx) -> std::unique_ptr<ApiController> {
    return std::unique_ptr<ApiController>(new ApiController(ctx));
}

ApiController::ApiController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

ApiController::~ApiController() = default;

void ApiController::register_routes(httplib::Server& server) {
    server.Get("/healthz", [](httplib::Request const&, httplib::Response& res) {
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Get("/api/v1/status", [this](httplib::Request const& req, httplib::Response& res) {
        handle_status(req, res);
    });

    server.Get(R"(/api/v1/entity/([^/]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_entity_get(req.matches[1].str(), res);
    });
    server.Post(R"(/api/v1/entity/([^/]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_command(req.matches[1].str(), req, res);
    });

    server.Get(R"(/api/v1/light/([a-z0-9_]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_light_get("light." + req.matches[1].str(), res);
    });
    server.Post(R"(/api/v1/light/([a-z0-9_]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_command("light." + req.matches[1].str(), req, res);
    });

    server.Get(R"(/api/v1/output/([A-Za-z0-9_\-]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_output_get(req.matches[1].str(), res);
    });
    server.Post(R"(/api/v1/output/([A-Za-z0-9_\-]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_command(req.matches[1].str(), req, res);
    });

    for (auto const& alias : kLegacyAliases) {
        std::string channel{alias.channel_id};
        server.Get(alias.path, [this, channel](httplib::Request const&, httplib::Response& res) {
            handle_output_get(channel, res);
        });
        server.Post(alias.path, [this, channel](httplib::Request const& req, httplib::Response& res) {
            handle_command(channel, req, res);
        });
    }
}

void ApiController::handle_status(httplib::Request const&, httplib::Response& res) {
    write_json_response(res, toJson(ctx_.status.build()), 200, true);
}

void ApiController::handle_entity_get(std::string const& entity_id, httplib::Response& res) {
    if (!isValidEntityId(entity_id)) {
        respond_not_found(res, "unknown entity '" + entity_id + "'");
        return;
    }
    auto state = ctx_.cache.get(entity_id);
    if (!state || isTombstone(**state)) {
        respond_not_found(res, "entity '" + entity_id + "' has not been observed");
        return;
    }
    write_json_response(res, toJson(**state), 200, true);
}

void ApiController::handle_light_get(std::string const& entity_id, httplib::Response& res) {
    auto state = ctx_.cache.get(entity_id);
    if (!state || isTombstone(**state)) {
        respond_not_found(res, "entity '" + entity_id + "' has not been observed");
        return;
    }
    auto on = asBool(**state);
    if (!on) {
        respond_not_found(res, "entity '" + entity_id + "' has no on/off state");
        return;
    }
    write_json_response(res, nlohmann::json(*on), 200, true);
}

void ApiController::handle_output_get(std::string const& channel_id, httplib::Response& res) {
    if (!ctx_.outputs.hasChannel(channel_id)) {
        respond_not_found(res, "unknown output '" + channel_id + "'");
        return;
    }
    write_json_response(res, nlohmann::json(ctx_.outputs.read(channel_id)), 200, true);
}

void ApiController::handle_command(std::string const& target, httplib::Request const& req, httplib::Response& res) {
    if (req.body.size() > kMaxCommandBodyBytes) {
        respond_payload_too_large(res);
        return;
    }
    auto desired = parse_desired_state(req.body);
    if (!desired) {
        respond_bad_request(res, desired.error().message.value_or("invalid body"));
        return;
    }

    hc_log("Command " + target + (*desired ? " on" : " off") + " from " + get_client_address(req), "DEBUG", "Http");

    auto result = ctx_.dispatcher.dispatch(CommandIntent{target, *desired});
    if (!result) {
        hc_log("Command " + target + " failed: " + describeError(result.error()), "WARN", "Http");
        respond_error(res, result.error());
        return;
    }
    write_json_response(res, dispatch_result_json(*result), 200, true);
}

} // namespace HC::Web
