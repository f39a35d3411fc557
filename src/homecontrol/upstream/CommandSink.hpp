#pragma once

#include "upstream/UpstreamProtocol.hpp"

#include <homecontrol/core/Error.hpp>

#include <chrono>
#include <string_view>

namespace HC::Upstream {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Authenticating,
    Subscribed,
};

[[nodiscard]] constexpr auto connectionStateToString(ConnectionState state) -> std::string_view {
    switch (state) {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Authenticating:
        return "authenticating";
    case ConnectionState::Subscribed:
        return "subscribed";
    }
    return "disconnected";
}

// Where the dispatcher sends upstream commands.
class CommandSink {
public:
    virtual ~CommandSink() = default;

    [[nodiscard]] virtual auto connectionState() const -> ConnectionState = 0;

    // Succeeds once the source acknowledges the call. Unreachable when not
    // subscribed, CommandRejected on a failed result, Timeout without an answer.
    virtual auto callService(ServiceCall const& call, std::chrono::milliseconds timeout) -> Expected<void> = 0;
};

} // namespace HC::Upstream
