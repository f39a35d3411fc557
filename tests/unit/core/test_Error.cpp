#include <homecontrol/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace HC;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::UnknownError);
             i <= static_cast<int>(Error::Code::HardwareFault);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::CommandRejected, "entity unavailable"};
        CHECK(describeError(withMsg) == "command_rejected:entity unavailable");

        CHECK(errorCodeToString(Error::Code::Unreachable) == "unreachable");
        CHECK(errorCodeToString(Error::Code::HardwareFault) == "hardware_fault");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Connection errors trigger reconnects") {
        CHECK(isConnectionError(Error{Error::Code::TransportFailure, "reset"}));
        CHECK(isConnectionError(Error{Error::Code::ProtocolError, "bad frame"}));
        CHECK(isConnectionError(Error{Error::Code::AuthenticationFailed, "token"}));
        CHECK(isConnectionError(Error{Error::Code::Timeout, "idle"}));
        CHECK_FALSE(isConnectionError(Error{Error::Code::MalformedEvent, "record"}));
        CHECK_FALSE(isConnectionError(Error{Error::Code::CommandRejected, "no"}));
    }
}
