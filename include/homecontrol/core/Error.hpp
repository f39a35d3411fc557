#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace HC {

struct Error {
    enum class Code {
        UnknownError = 0,
        InvalidArgument,
        MalformedInput,
        NotFound,
        NotSupported,
        Timeout,
        TransportFailure,
        ProtocolError,
        MalformedEvent,
        AuthenticationFailed,
        Unreachable,
        CommandRejected,
        HardwareFault
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::TransportFailure:
        return "transport_failure";
    case Error::Code::ProtocolError:
        return "protocol_error";
    case Error::Code::MalformedEvent:
        return "malformed_event";
    case Error::Code::AuthenticationFailed:
        return "authentication_failed";
    case Error::Code::Unreachable:
        return "unreachable";
    case Error::Code::CommandRejected:
        return "command_rejected";
    case Error::Code::HardwareFault:
        return "hardware_fault";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Connection drops and protocol violations are recovered by reconnecting.
[[nodiscard]] inline auto isConnectionError(Error const& error) -> bool {
    return error.code == Error::Code::TransportFailure || error.code == Error::Code::ProtocolError
           || error.code == Error::Code::AuthenticationFailed || error.code == Error::Code::Timeout;
}

} // namespace HC
