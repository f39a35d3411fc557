#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <homecontrol/web/gateway/routing/ProxyController.hpp>

#include <homecontrol/web/GatewayOptions.hpp>
#include <homecontrol/web/gateway/routing/HttpHelpers.hpp>

#include "log/TaggedLogger.hpp"

#include "httplib.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <string>

namespace HC::Web {

namespace {

constexpr auto kRelayTimeout = std::chrono::seconds{10};

// Hop-by-hop and framing headers are regenerated by each side.
constexpr std::array<std::string_view, 6> kSkippedHeaders = {
    "Host", "Connection", "Content-Length", "Transfer-Encoding", "Keep-Alive", "Upgrade",
};

auto header_equals(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size()
           && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
              });
}

auto is_skipped_header(std::string const& name) -> bool {
    return std::any_of(kSkippedHeaders.begin(), kSkippedHeaders.end(), [&](std::string_view skipped) {
        return header_equals(name, skipped);
    });
}

std::unique_ptr<httplib::ClientImpl> make_http_client(RelayTarget const& target) {
    std::unique_ptr<httplib::ClientImpl> client;
    if (target.tls) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        auto ssl_client = std::make_unique<httplib::SSLClient>(target.host, target.port);
        ssl_client->enable_server_certificate_verification(true);
        client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
#else
        return nullptr;
#endif
    } else {
        client = std::make_unique<httplib::ClientImpl>(target.host, target.port);
    }
    int timeout_seconds = static_cast<int>(kRelayTimeout.count());
    client->set_connection_timeout(timeout_seconds, 0);
    client->set_read_timeout(timeout_seconds, 0);
    client->set_write_timeout(timeout_seconds, 0);
    client->set_follow_location(false);
    client->set_keep_alive(false);
    return client;
}

} // namespace

auto parse_relay_url(std::string_view url) -> std::optional<RelayTarget> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    RelayTarget target;
    auto        scheme = url.substr(0, scheme_end);
    if (scheme == "https") {
        target.tls  = true;
        target.port = 443;
    } else if (scheme != "http") {
        return std::nullopt;
    }

    auto remainder = url.substr(scheme_end + 3);
    auto slash     = remainder.find('/');
    auto authority = remainder.substr(0, slash);
    if (slash != std::string_view::npos) {
        target.prefix = std::string{remainder.substr(slash)};
        while (!target.prefix.empty() && target.prefix.back() == '/') {
            target.prefix.pop_back();
        }
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        auto port_text = authority.substr(colon + 1);
        int  port      = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        target.port = static_cast<std::uint16_t>(port);
        authority   = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    target.host = std::string{authority};
    return target;
}

auto ProxyController::Create(HttpRequestContext& ctx) -> std::unique_ptr<ProxyController> {
    return std::unique_ptr<ProxyController>(new ProxyController(ctx));
}

ProxyController::ProxyController(HttpRequestContext& ctx)
    : ctx_(ctx) {
    if (!ctx_.options.reverse_proxy_url.empty()) {
        target_ = parse_relay_url(ctx_.options.reverse_proxy_url);
        if (!target_) {
            hc_log("Ignoring unusable relay url " + ctx_.options.reverse_proxy_url, "WARN", "Http");
        }
    }
}

ProxyController::~ProxyController() = default;

void ProxyController::register_routes(httplib::Server& server) {
    auto handler = [this](httplib::Request const& req, httplib::Response& res) { handle_relay(req, res); };
    server.Get(".*", handler);
    server.Post(".*", handler);
    server.Put(".*", handler);
    server.Patch(".*", handler);
    server.Delete(".*", handler);
    server.Options(".*", handler);
}

void ProxyController::handle_relay(httplib::Request const& req, httplib::Response& res) {
    if (!target_) {
        respond_not_found(res, "no route for " + req.path);
        return;
    }

    auto client = make_http_client(*target_);
    if (!client) {
        respond_error(res, Error{Error::Code::TransportFailure, "relay client unavailable"});
        return;
    }

    httplib::Request forwarded;
    forwarded.method = req.method;
    forwarded.path   = httplib::append_query_params(target_->prefix + req.path, req.params);
    forwarded.body   = req.body;
    for (auto const& [name, value] : req.headers) {
        if (!is_skipped_header(name)) {
            forwarded.headers.emplace(name, value);
        }
    }

    auto result = client->send(forwarded);
    if (!result) {
        auto message = "relay " + req.method + " " + req.path + " failed: " + httplib::to_string(result.error());
        hc_log(message, "WARN", "Http");
        respond_error(res, Error{Error::Code::TransportFailure, message});
        return;
    }

    res.status = result->status;
    for (auto const& [name, value] : result->headers) {
        if (!is_skipped_header(name) && !header_equals(name, "Content-Type")) {
            res.set_header(name, value);
        }
    }
    auto content_type = result->get_header_value("Content-Type");
    res.set_content(result->body, content_type.empty() ? "application/octet-stream" : content_type);
}

} // namespace HC::Web
