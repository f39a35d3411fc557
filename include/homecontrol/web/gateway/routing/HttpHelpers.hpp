#pragma once

#include <homecontrol/core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace HC {
class EntityCache;
class CommandDispatcher;
class StatusViewBuilder;
namespace Hardware {
class HardwareOutputDriver;
}
} // namespace HC

namespace HC::Web {

struct GatewayOptions;

struct HttpRequestContext {
    GatewayOptions const&           options;
    EntityCache const&              cache;
    CommandDispatcher&              dispatcher;
    StatusViewBuilder const&        status;
    Hardware::HardwareOutputDriver& outputs;
};

auto get_client_address(httplib::Request const& req) -> std::string;

// Command bodies are a JSON boolean or a small integer; anything longer is refused.
inline constexpr std::size_t kMaxCommandBodyBytes = 16;

void write_json_response(httplib::Response& res,
                         nlohmann::json const& payload,
                         int                  status,
                         bool                 no_store = false);

void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_not_found(httplib::Response& res, std::string_view message);
void respond_payload_too_large(httplib::Response& res);
void respond_error(httplib::Response& res, Error const& error);

auto status_for_error(Error::Code code) -> int;

// `true`/`false`, or an integer where 0 means off. Surrounding whitespace is allowed.
auto parse_desired_state(std::string_view body) -> Expected<bool>;

} // namespace HC::Web
