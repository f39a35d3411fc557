#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace httplib {
class Server;
class Request;
class Response;
} // namespace httplib

namespace HC::Web {

struct HttpRequestContext;

struct RelayTarget {
    bool          tls{false};
    std::string   host;
    std::uint16_t port{80};
    std::string   prefix; // no trailing slash; empty for the root
};

auto parse_relay_url(std::string_view url) -> std::optional<RelayTarget>;

/**
 * Forwards every request no other controller claimed to the configured
 * reverse-proxy target. Register it last: its routes match any path.
 */
class ProxyController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<ProxyController>;

    void register_routes(httplib::Server& server);

    ~ProxyController();

private:
    explicit ProxyController(HttpRequestContext& ctx);

    HttpRequestContext&        ctx_;
    std::optional<RelayTarget> target_;

    void handle_relay(httplib::Request const& req, httplib::Response& res);
};

} // namespace HC::Web
