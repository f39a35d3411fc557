#include "upstream/UpstreamSession.hpp"

#include <charconv>

namespace HC::Upstream {

auto parseUpstreamUrl(std::string_view url) -> Expected<UpstreamEndpoint> {
    UpstreamEndpoint endpoint;
    std::string_view rest;
    if (url.starts_with("wss://")) {
        endpoint.tls  = true;
        endpoint.port = 443;
        rest          = url.substr(6);
    } else if (url.starts_with("ws://")) {
        endpoint.port = 80;
        rest          = url.substr(5);
    } else {
        return std::unexpected(Error{Error::Code::InvalidArgument, "upstream url must start with ws:// or wss://"});
    }

    auto slash     = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        endpoint.path = std::string{rest.substr(slash)};
    }
    if (authority.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "upstream url has no host"});
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        auto          port_text = authority.substr(colon + 1);
        unsigned long port      = 0;
        auto parsed = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (parsed.ec != std::errc{} || parsed.ptr != port_text.data() + port_text.size() || port == 0
            || port > 65535) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "upstream url has an invalid port"});
        }
        endpoint.port = static_cast<std::uint16_t>(port);
        authority     = authority.substr(0, colon);
    }
    if (authority.size() > 2 && authority.front() == '[' && authority.back() == ']') {
        authority = authority.substr(1, authority.size() - 2);
    }
    if (authority.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "upstream url has no host"});
    }
    endpoint.host = std::string{authority};
    return endpoint;
}

} // namespace HC::Upstream
