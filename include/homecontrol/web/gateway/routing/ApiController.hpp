#pragma once

#include <memory>
#include <string>

namespace httplib {
class Server;
class Request;
class Response;
} // namespace httplib

namespace HC::Web {

struct HttpRequestContext;

// Status, entity and output routes under /api/v1, plus /healthz.
class ApiController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<ApiController>;

    void register_routes(httplib::Server& server);

    ~ApiController();

private:
    explicit ApiController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;

    void handle_status(httplib::Request const& req, httplib::Response& res);
    void handle_entity_get(std::string const& entity_id, httplib::Response& res);
    void handle_light_get(std::string const& entity_id, httplib::Response& res);
    void handle_output_get(std::string const& channel_id, httplib::Response& res);
    void handle_command(std::string const& target, httplib::Request const& req, httplib::Response& res);
};

} // namespace HC::Web
