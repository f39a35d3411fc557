#include "upstream/WebSocketFrame.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <utility>

namespace HC::Upstream::WebSocket {

namespace {

[[nodiscard]] auto protocol_error(std::string message) -> Error {
    return Error{Error::Code::ProtocolError, std::move(message)};
}

[[nodiscard]] auto to_lower(std::string_view value) -> std::string {
    std::string lowered;
    lowered.reserve(value.size());
    std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

[[nodiscard]] auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

[[nodiscard]] auto is_known_opcode(std::uint8_t value) -> bool {
    switch (static_cast<Opcode>(value)) {
    case Opcode::Continuation:
    case Opcode::Text:
    case Opcode::Binary:
    case Opcode::Close:
    case Opcode::Ping:
    case Opcode::Pong:
        return true;
    }
    return false;
}

} // namespace

auto isControl(Opcode opcode) -> bool {
    return (static_cast<std::uint8_t>(opcode) & 0x8U) != 0;
}

auto encodeFrame(Opcode opcode, std::string_view payload, MaskKey mask, bool fin) -> std::string {
    std::string frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<char>((fin ? 0x80U : 0x00U) | static_cast<std::uint8_t>(opcode)));

    auto const size = payload.size();
    if (size < 126) {
        frame.push_back(static_cast<char>(0x80U | size));
    } else if (size <= 0xFFFF) {
        frame.push_back(static_cast<char>(0x80U | 126U));
        frame.push_back(static_cast<char>((size >> 8) & 0xFF));
        frame.push_back(static_cast<char>(size & 0xFF));
    } else {
        frame.push_back(static_cast<char>(0x80U | 127U));
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back(static_cast<char>((static_cast<std::uint64_t>(size) >> shift) & 0xFF));
        }
    }
    for (auto byte : mask) {
        frame.push_back(static_cast<char>(byte));
    }
    for (std::size_t i = 0; i < size; ++i) {
        frame.push_back(static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return frame;
}

void FrameDecoder::feed(std::string_view bytes) {
    if (offset_ > 0 && offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    buffer_.append(bytes);
}

auto FrameDecoder::next() -> Expected<std::optional<Frame>> {
    if (failed_) {
        return std::unexpected(protocol_error("decoder failed earlier"));
    }
    auto fail = [this](std::string message) -> Expected<std::optional<Frame>> {
        failed_ = true;
        return std::unexpected(protocol_error(std::move(message)));
    };

    auto available = buffer_.size() - offset_;
    if (available < 2) {
        return std::optional<Frame>{};
    }
    auto const* data = reinterpret_cast<std::uint8_t const*>(buffer_.data() + offset_);

    auto const first  = data[0];
    auto const second = data[1];
    if ((first & 0x70U) != 0) {
        return fail("reserved bits set");
    }
    auto opcode_value = static_cast<std::uint8_t>(first & 0x0FU);
    if (!is_known_opcode(opcode_value)) {
        return fail("reserved opcode " + std::to_string(opcode_value));
    }
    if ((second & 0x80U) != 0) {
        return fail("server frames must not be masked");
    }

    Frame frame;
    frame.fin    = (first & 0x80U) != 0;
    frame.opcode = static_cast<Opcode>(opcode_value);

    std::size_t   header = 2;
    std::uint64_t length = second & 0x7FU;
    if (length == 126) {
        if (available < 4) {
            return std::optional<Frame>{};
        }
        length = (static_cast<std::uint64_t>(data[2]) << 8) | data[3];
        header = 4;
    } else if (length == 127) {
        if (available < 10) {
            return std::optional<Frame>{};
        }
        length = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            length = (length << 8) | data[2 + i];
        }
        if ((length >> 63) != 0) {
            return fail("payload length out of range");
        }
        header = 10;
    }

    if (isControl(frame.opcode)) {
        if (!frame.fin) {
            return fail("fragmented control frame");
        }
        if (length > kMaxControlPayloadBytes) {
            return fail("control frame payload too large");
        }
    }
    if (length > kMaxPayloadBytes) {
        return fail("frame payload exceeds limit");
    }
    if (available < header + length) {
        return std::optional<Frame>{};
    }

    frame.payload.assign(buffer_.data() + offset_ + header, static_cast<std::size_t>(length));
    offset_ += header + static_cast<std::size_t>(length);
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    return std::optional<Frame>{std::move(frame)};
}

auto MessageAssembler::push(Frame frame) -> Expected<std::optional<Output>> {
    using Kind = Output::Kind;
    switch (frame.opcode) {
    case Opcode::Ping:
        return std::optional<Output>{Output{Kind::Ping, std::move(frame.payload)}};
    case Opcode::Pong:
        return std::optional<Output>{Output{Kind::Pong, std::move(frame.payload)}};
    case Opcode::Close:
        return std::optional<Output>{Output{Kind::Close, std::move(frame.payload)}};
    case Opcode::Binary:
        return std::unexpected(protocol_error("binary messages are not supported"));
    case Opcode::Text:
        if (partial_) {
            return std::unexpected(protocol_error("text frame interrupts a fragmented message"));
        }
        if (frame.fin) {
            return std::optional<Output>{Output{Kind::Text, std::move(frame.payload)}};
        }
        partial_ = std::move(frame.payload);
        return std::optional<Output>{};
    case Opcode::Continuation:
        if (!partial_) {
            return std::unexpected(protocol_error("continuation without a message"));
        }
        if (partial_->size() + frame.payload.size() > kMaxPayloadBytes) {
            return std::unexpected(protocol_error("message exceeds limit"));
        }
        partial_->append(frame.payload);
        if (!frame.fin) {
            return std::optional<Output>{};
        }
        {
            Output output{Kind::Text, std::move(*partial_)};
            partial_.reset();
            return std::optional<Output>{std::move(output)};
        }
    }
    return std::unexpected(protocol_error("unexpected opcode"));
}

auto encodeBase64(std::span<std::uint8_t const> bytes) -> std::string {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded;
    encoded.reserve(((bytes.size() + 2U) / 3U) * 4U);
    std::size_t index = 0;
    while (index + 2U < bytes.size()) {
        auto b0 = bytes[index];
        auto b1 = bytes[index + 1U];
        auto b2 = bytes[index + 2U];
        encoded.push_back(kAlphabet[b0 >> 2U]);
        encoded.push_back(kAlphabet[((b0 & 0x03U) << 4U) | (b1 >> 4U)]);
        encoded.push_back(kAlphabet[((b1 & 0x0FU) << 2U) | (b2 >> 6U)]);
        encoded.push_back(kAlphabet[b2 & 0x3FU]);
        index += 3U;
    }
    if (index < bytes.size()) {
        auto b0 = bytes[index];
        encoded.push_back(kAlphabet[b0 >> 2U]);
        if (index + 1U < bytes.size()) {
            auto b1 = bytes[index + 1U];
            encoded.push_back(kAlphabet[((b0 & 0x03U) << 4U) | (b1 >> 4U)]);
            encoded.push_back(kAlphabet[(b1 & 0x0FU) << 2U]);
            encoded.push_back('=');
        } else {
            encoded.push_back(kAlphabet[(b0 & 0x03U) << 4U]);
            encoded.push_back('=');
            encoded.push_back('=');
        }
    }
    return encoded;
}

auto makeHandshakeKey(std::array<std::uint8_t, 16> const& nonce) -> std::string {
    return encodeBase64(std::span<std::uint8_t const>(nonce.data(), nonce.size()));
}

auto computeAcceptKey(std::string_view key) -> std::string {
    std::string material{key};
    material.append(kAcceptGuid);
    std::array<std::uint8_t, SHA_DIGEST_LENGTH> digest{};
    SHA1(reinterpret_cast<unsigned char const*>(material.data()), material.size(), digest.data());
    return encodeBase64(std::span<std::uint8_t const>(digest.data(), digest.size()));
}

auto buildHandshakeRequest(std::string_view host,
                           std::uint16_t    port,
                           std::string_view path,
                           std::string_view key) -> std::string {
    std::string request;
    request.append("GET ").append(path.empty() ? std::string_view{"/"} : path).append(" HTTP/1.1\r\n");
    request.append("Host: ").append(host);
    if (port != 80 && port != 443) {
        request.append(":").append(std::to_string(port));
    }
    request.append("\r\n");
    request.append("Upgrade: websocket\r\n");
    request.append("Connection: Upgrade\r\n");
    request.append("Sec-WebSocket-Key: ").append(key).append("\r\n");
    request.append("Sec-WebSocket-Version: 13\r\n");
    request.append("User-Agent: homecontrol-gateway\r\n");
    request.append("\r\n");
    return request;
}

auto validateHandshakeResponse(std::string_view head, std::string_view key) -> Expected<void> {
    auto line_end = head.find("\r\n");
    if (line_end == std::string_view::npos) {
        return std::unexpected(Error{Error::Code::TransportFailure, "handshake response truncated"});
    }
    auto status_line = head.substr(0, line_end);
    auto first_space = status_line.find(' ');
    if (!status_line.starts_with("HTTP/1.1") || first_space == std::string_view::npos) {
        return std::unexpected(Error{Error::Code::TransportFailure, "handshake status line malformed"});
    }
    int  status      = 0;
    auto status_text = status_line.substr(first_space + 1, 3);
    auto parsed      = std::from_chars(status_text.data(), status_text.data() + status_text.size(), status);
    if (parsed.ec != std::errc{}) {
        return std::unexpected(Error{Error::Code::TransportFailure, "handshake status line malformed"});
    }
    if (status != 101) {
        return std::unexpected(
            Error{Error::Code::TransportFailure, "upgrade refused with HTTP " + std::to_string(status)});
    }

    bool        upgrade_ok = false;
    std::string accept;
    auto        rest = head.substr(line_end + 2);
    while (!rest.empty()) {
        auto end  = rest.find("\r\n");
        auto line = rest.substr(0, end);
        rest      = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 2);
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        auto name  = to_lower(trim(line.substr(0, colon)));
        auto value = trim(line.substr(colon + 1));
        if (name == "upgrade") {
            upgrade_ok = to_lower(value) == "websocket";
        } else if (name == "sec-websocket-accept") {
            accept = std::string{value};
        }
    }
    if (!upgrade_ok) {
        return std::unexpected(Error{Error::Code::ProtocolError, "missing Upgrade: websocket header"});
    }
    if (accept != computeAcceptKey(key)) {
        return std::unexpected(Error{Error::Code::ProtocolError, "Sec-WebSocket-Accept mismatch"});
    }
    return {};
}

} // namespace HC::Upstream::WebSocket
