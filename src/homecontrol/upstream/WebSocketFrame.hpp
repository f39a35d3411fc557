#pragma once

#include <homecontrol/core/Error.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace HC::Upstream::WebSocket {

inline constexpr std::string_view kAcceptGuid{"258EAFA5-E914-47DA-95CA-C5AB0DC85B11"};
inline constexpr std::size_t      kMaxPayloadBytes{16U * 1024U * 1024U};
inline constexpr std::size_t      kMaxControlPayloadBytes{125U};

enum class Opcode : std::uint8_t {
    Continuation = 0x0,
    Text         = 0x1,
    Binary       = 0x2,
    Close        = 0x8,
    Ping         = 0x9,
    Pong         = 0xA,
};

struct Frame {
    bool        fin{true};
    Opcode      opcode{Opcode::Text};
    std::string payload;
};

using MaskKey = std::array<std::uint8_t, 4>;

[[nodiscard]] auto isControl(Opcode opcode) -> bool;

// Client-to-server frames are always masked.
[[nodiscard]] auto encodeFrame(Opcode opcode, std::string_view payload, MaskKey mask, bool fin = true) -> std::string;

/**
 * Incremental decoder for server-to-client frames.
 *
 * Bytes are appended with feed(); next() yields complete frames in order, or
 * nullopt when more bytes are needed. Any framing violation is a ProtocolError
 * and leaves the decoder unusable.
 */
class FrameDecoder {
public:
    void feed(std::string_view bytes);
    [[nodiscard]] auto next() -> Expected<std::optional<Frame>>;
    [[nodiscard]] auto buffered() const -> std::size_t { return buffer_.size() - offset_; }

private:
    std::string buffer_;
    std::size_t offset_{0};
    bool        failed_{false};
};

/**
 * Joins fragmented data frames into messages and surfaces control frames.
 */
class MessageAssembler {
public:
    struct Output {
        enum class Kind { Text, Ping, Pong, Close };
        Kind        kind{Kind::Text};
        std::string payload;
    };

    [[nodiscard]] auto push(Frame frame) -> Expected<std::optional<Output>>;

private:
    std::optional<std::string> partial_;
};

[[nodiscard]] auto encodeBase64(std::span<std::uint8_t const> bytes) -> std::string;
[[nodiscard]] auto makeHandshakeKey(std::array<std::uint8_t, 16> const& nonce) -> std::string;
[[nodiscard]] auto computeAcceptKey(std::string_view key) -> std::string;
[[nodiscard]] auto buildHandshakeRequest(std::string_view host,
                                         std::uint16_t    port,
                                         std::string_view path,
                                         std::string_view key) -> std::string;

// `head` is the response up to and including the blank line.
[[nodiscard]] auto validateHandshakeResponse(std::string_view head, std::string_view key) -> Expected<void>;

} // namespace HC::Upstream::WebSocket
