#pragma once

#include <homecontrol/core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace HC::Upstream {

struct UpstreamEndpoint {
    bool          tls{false};
    std::string   host;
    std::uint16_t port{0};
    std::string   path{"/api/websocket"};
};

// Parses `ws://host[:port]/path` or `wss://host[:port]/path`.
[[nodiscard]] auto parseUpstreamUrl(std::string_view url) -> Expected<UpstreamEndpoint>;

struct UpstreamOptions {
    std::string               url;
    std::string               access_token;
    std::string               ca_cert_path;
    bool                      verify_tls{true};
    std::chrono::milliseconds connect_timeout{std::chrono::milliseconds{5000}};
};

/**
 * One persistent message channel to the source.
 *
 * A session carries whole text messages; framing, pings issued by the peer
 * and transport security are the implementation's concern. A session is used
 * from a single thread at a time.
 */
class UpstreamSession {
public:
    virtual ~UpstreamSession() = default;

    virtual auto send(std::string_view text) -> Expected<void> = 0;

    // nullopt means nothing arrived within `timeout`; errors are terminal for the session.
    virtual auto receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> = 0;

    virtual void close() = 0;
};

class UpstreamSessionFactory {
public:
    virtual ~UpstreamSessionFactory() = default;
    virtual auto create(UpstreamOptions const& options) -> Expected<std::shared_ptr<UpstreamSession>> = 0;
};

[[nodiscard]] auto makeWebSocketSessionFactory() -> std::shared_ptr<UpstreamSessionFactory>;

} // namespace HC::Upstream
