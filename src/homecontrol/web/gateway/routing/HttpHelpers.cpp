#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <homecontrol/web/gateway/routing/HttpHelpers.hpp>

#include "httplib.h"

#include <cstdint>
#include <string>

namespace HC::Web {

auto get_client_address(httplib::Request const& req) -> std::string {
    auto forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) {
        auto comma = forwarded.find(',');
        return forwarded.substr(0, comma);
    }
    return req.remote_addr;
}

void write_json_response(httplib::Response& res,
                         nlohmann::json const& payload,
                         int                  status,
                         bool                 no_store) {
    res.status = status;
    res.set_content(payload.dump(), "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "bad_request"},
                                       {"message", message}},
                        400,
                        true);
}

void respond_not_found(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "not_found"},
                                       {"message", message}},
                        404,
                        true);
}

void respond_payload_too_large(httplib::Response& res) {
    write_json_response(res,
                        nlohmann::json{{"error", "payload_too_large"},
                                       {"message", "Request body exceeds 16 bytes"}},
                        413,
                        true);
}

auto status_for_error(Error::Code code) -> int {
    switch (code) {
    case Error::Code::InvalidArgument:
    case Error::Code::MalformedInput:
        return 400;
    case Error::Code::NotFound:
        return 404;
    case Error::Code::CommandRejected:
    case Error::Code::TransportFailure:
        return 502;
    case Error::Code::Unreachable:
        return 503;
    case Error::Code::Timeout:
        return 504;
    case Error::Code::NotSupported:
        return 501;
    default:
        return 500;
    }
}

void respond_error(httplib::Response& res, Error const& error) {
    auto label = errorCodeToString(error.code);
    write_json_response(res,
                        nlohmann::json{{"error", label},
                                       {"message", error.message.value_or(std::string{label})}},
                        status_for_error(error.code),
                        true);
}

auto parse_desired_state(std::string_view body) -> Expected<bool> {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "body must be a JSON boolean or integer"});
    }
    if (json.is_boolean()) {
        return json.get<bool>();
    }
    if (json.is_number_integer()) {
        return json.get<std::int64_t>() != 0;
    }
    return std::unexpected(Error{Error::Code::MalformedInput, "body must be a JSON boolean or integer"});
}

} // namespace HC::Web
