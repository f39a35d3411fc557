#include "upstream/UpstreamSession.hpp"

#include "log/TaggedLogger.hpp"
#include "upstream/WebSocketFrame.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <openssl/rand.h>
#include <openssl/ssl.h>

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>

namespace HC::Upstream {
namespace {

using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;
using Clock     = std::chrono::steady_clock;

constexpr std::size_t kMaxHandshakeBytes{16U * 1024U};

[[nodiscard]] auto make_transport_error(std::string message) -> Error {
    return Error{Error::Code::TransportFailure, std::move(message)};
}

[[nodiscard]] auto configure_client_context(UpstreamOptions const& options)
    -> Expected<std::shared_ptr<asio::ssl::context>> {
    try {
        auto context = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
        context->set_options(asio::ssl::context::default_workarounds
                             | asio::ssl::context::no_sslv2
                             | asio::ssl::context::no_sslv3);
        if (options.verify_tls) {
            if (options.ca_cert_path.empty()) {
                context->set_default_verify_paths();
            } else {
                context->load_verify_file(options.ca_cert_path);
            }
            context->set_verify_mode(asio::ssl::verify_peer);
        } else {
            context->set_verify_mode(asio::ssl::verify_none);
        }
        return context;
    } catch (std::system_error const& err) {
        return std::unexpected(make_transport_error(err.what()));
    }
}

[[nodiscard]] auto random_bytes(std::span<std::uint8_t> out) -> Expected<void> {
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        return std::unexpected(Error{Error::Code::UnknownError, "RAND_bytes failed"});
    }
    return {};
}

} // namespace

/**
 * WebSocket client session over a plain TCP socket or a TLS stream.
 *
 * All I/O runs on a private io_context driven by the calling thread; a read is
 * kept outstanding between receive() calls so a timeout never cancels a TLS
 * record half way through.
 */
class WebSocketSession final : public UpstreamSession {
public:
    explicit WebSocketSession(UpstreamOptions options)
        : options_(std::move(options)) {}

    ~WebSocketSession() override { shutdown_transport(); }

    auto connect(UpstreamEndpoint const& endpoint, std::shared_ptr<asio::ssl::context> context) -> Expected<void> {
        auto deadline = Clock::now() + options_.connect_timeout;
        context_      = std::move(context);
        if (context_) {
            tls_ = std::make_unique<TlsStream>(io_, *context_);
        } else {
            plain_ = std::make_unique<asio::ip::tcp::socket>(io_);
        }

        std::error_code         ec;
        asio::ip::tcp::resolver resolver(io_);
        auto endpoints = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
        if (ec) {
            return std::unexpected(make_transport_error("resolve " + endpoint.host + ": " + ec.message()));
        }

        bool            connected = false;
        std::error_code connect_ec;
        asio::async_connect(lowest_layer(), endpoints, [&](std::error_code result, auto const&) {
            connect_ec = result;
            connected  = true;
        });
        if (!run_until([&] { return connected; }, deadline)) {
            return std::unexpected(Error{Error::Code::Timeout, "connect to " + endpoint.host + " timed out"});
        }
        if (connect_ec) {
            return std::unexpected(make_transport_error("connect " + endpoint.host + ": " + connect_ec.message()));
        }

        if (tls_) {
            if (SSL_set_tlsext_host_name(tls_->native_handle(), endpoint.host.c_str()) != 1) {
                return std::unexpected(make_transport_error("failed to set SNI host name"));
            }
            if (options_.verify_tls) {
                tls_->set_verify_callback(asio::ssl::host_name_verification(endpoint.host));
            }
            bool            handshaken = false;
            std::error_code handshake_ec;
            tls_->async_handshake(asio::ssl::stream_base::client, [&](std::error_code result) {
                handshake_ec = result;
                handshaken   = true;
            });
            if (!run_until([&] { return handshaken; }, deadline)) {
                return std::unexpected(Error{Error::Code::Timeout, "TLS handshake timed out"});
            }
            if (handshake_ec) {
                return std::unexpected(make_transport_error("TLS handshake: " + handshake_ec.message()));
            }
        }

        return upgrade(endpoint, deadline);
    }

    auto send(std::string_view text) -> Expected<void> override {
        return send_frame(WebSocket::Opcode::Text, text);
    }

    auto receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> override {
        if (closed_) {
            return std::unexpected(make_transport_error("session closed"));
        }
        auto deadline = Clock::now() + timeout;
        while (true) {
            if (!inbox_.empty()) {
                decoder_.feed(inbox_);
                inbox_.clear();
            }
            auto message = pump_decoder();
            if (!message) {
                return std::unexpected(message.error());
            }
            if (*message) {
                return message;
            }
            if (read_error_) {
                return std::unexpected(make_transport_error(read_error_ == asio::error::eof
                                                                ? std::string{"connection closed by peer"}
                                                                : read_error_.message()));
            }
            if (!reading_) {
                start_read();
            }
            auto now = Clock::now();
            if (now >= deadline) {
                return std::optional<std::string>{};
            }
            io_.restart();
            io_.run_one_for(deadline - now);
        }
    }

    void close() override {
        if (closed_) {
            return;
        }
        if (upgraded_) {
            auto sent = send_frame(WebSocket::Opcode::Close, std::string_view{"\x03\xe8", 2});
            if (!sent) {
                hc_log("Close frame not delivered: " + describeError(sent.error()), "DEBUG", "Sync");
            }
        }
        shutdown_transport();
    }

private:
    [[nodiscard]] auto lowest_layer() -> asio::ip::tcp::socket& {
        return tls_ ? tls_->next_layer() : *plain_;
    }

    template <typename Fn>
    void with_stream(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        } else {
            fn(*plain_);
        }
    }

    // Drives the io_context until `done()` holds or the deadline passes.
    template <typename Predicate>
    auto run_until(Predicate done, Clock::time_point deadline) -> bool {
        while (!done()) {
            auto now = Clock::now();
            if (now >= deadline) {
                shutdown_transport();
                return false;
            }
            io_.restart();
            io_.run_one_for(deadline - now);
        }
        return true;
    }

    void start_read() {
        reading_ = true;
        with_stream([this](auto& stream) {
            stream.async_read_some(asio::buffer(read_buffer_), [this](std::error_code ec, std::size_t bytes) {
                reading_ = false;
                if (ec) {
                    read_error_ = ec;
                    return;
                }
                inbox_.append(read_buffer_.data(), bytes);
            });
        });
    }

    auto write_all(std::string const& bytes) -> Expected<void> {
        if (closed_) {
            return std::unexpected(make_transport_error("session closed"));
        }
        bool            written = false;
        std::error_code write_ec;
        with_stream([&](auto& stream) {
            asio::async_write(stream, asio::buffer(bytes), [&](std::error_code ec, std::size_t) {
                write_ec = ec;
                written  = true;
            });
        });
        if (!run_until([&] { return written; }, Clock::now() + options_.connect_timeout)) {
            return std::unexpected(Error{Error::Code::Timeout, "write timed out"});
        }
        if (write_ec) {
            return std::unexpected(make_transport_error("write: " + write_ec.message()));
        }
        return {};
    }

    auto send_frame(WebSocket::Opcode opcode, std::string_view payload) -> Expected<void> {
        WebSocket::MaskKey mask{};
        if (auto filled = random_bytes(mask); !filled) {
            return std::unexpected(filled.error());
        }
        return write_all(WebSocket::encodeFrame(opcode, payload, mask));
    }

    auto upgrade(UpstreamEndpoint const& endpoint, Clock::time_point deadline) -> Expected<void> {
        std::array<std::uint8_t, 16> nonce{};
        if (auto filled = random_bytes(nonce); !filled) {
            return std::unexpected(filled.error());
        }
        auto key     = WebSocket::makeHandshakeKey(nonce);
        auto request = WebSocket::buildHandshakeRequest(endpoint.host, endpoint.port, endpoint.path, key);
        if (auto written = write_all(request); !written) {
            return written;
        }

        while (true) {
            auto end = inbox_.find("\r\n\r\n");
            if (end != std::string::npos) {
                auto head = inbox_.substr(0, end + 4);
                inbox_.erase(0, end + 4);
                auto valid = WebSocket::validateHandshakeResponse(head, key);
                if (!valid) {
                    return valid;
                }
                upgraded_ = true;
                return {};
            }
            if (inbox_.size() > kMaxHandshakeBytes) {
                return std::unexpected(Error{Error::Code::ProtocolError, "handshake response too large"});
            }
            if (read_error_) {
                return std::unexpected(make_transport_error("handshake: " + read_error_.message()));
            }
            start_read();
            if (!run_until([this] { return !reading_; }, deadline)) {
                return std::unexpected(Error{Error::Code::Timeout, "WebSocket upgrade timed out"});
            }
        }
    }

    auto pump_decoder() -> Expected<std::optional<std::string>> {
        while (true) {
            auto frame = decoder_.next();
            if (!frame) {
                return std::unexpected(frame.error());
            }
            if (!*frame) {
                return std::optional<std::string>{};
            }
            auto output = assembler_.push(std::move(**frame));
            if (!output) {
                return std::unexpected(output.error());
            }
            if (!*output) {
                continue;
            }
            using Kind = WebSocket::MessageAssembler::Output::Kind;
            switch ((*output)->kind) {
            case Kind::Text:
                return std::optional<std::string>{std::move((*output)->payload)};
            case Kind::Ping:
                if (auto sent = send_frame(WebSocket::Opcode::Pong, (*output)->payload); !sent) {
                    return std::unexpected(sent.error());
                }
                break;
            case Kind::Pong:
                break;
            case Kind::Close:
                return std::unexpected(Error{Error::Code::ProtocolError, "peer sent close frame"});
            }
        }
    }

    void shutdown_transport() {
        if (closed_) {
            return;
        }
        closed_ = true;
        if (!tls_ && !plain_) {
            return;
        }
        std::error_code ec;
        lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        lowest_layer().close(ec);
    }

    UpstreamOptions                     options_;
    asio::io_context                    io_;
    std::shared_ptr<asio::ssl::context> context_;
    std::unique_ptr<TlsStream>          tls_;
    std::unique_ptr<asio::ip::tcp::socket> plain_;
    std::array<char, 8192>              read_buffer_{};
    std::string                         inbox_;
    std::error_code                     read_error_;
    bool                                reading_{false};
    bool                                upgraded_{false};
    bool                                closed_{false};
    WebSocket::FrameDecoder             decoder_;
    WebSocket::MessageAssembler         assembler_;
};

namespace {

class WebSocketSessionFactory final : public UpstreamSessionFactory {
public:
    auto create(UpstreamOptions const& options) -> Expected<std::shared_ptr<UpstreamSession>> override {
        auto endpoint = parseUpstreamUrl(options.url);
        if (!endpoint) {
            return std::unexpected(endpoint.error());
        }
        std::shared_ptr<asio::ssl::context> context;
        if (endpoint->tls) {
            auto configured = configure_client_context(options);
            if (!configured) {
                return std::unexpected(configured.error());
            }
            context = std::move(*configured);
        }
        auto session = std::make_shared<WebSocketSession>(options);
        if (auto connected = session->connect(*endpoint, std::move(context)); !connected) {
            return std::unexpected(connected.error());
        }
        return session;
    }
};

} // namespace

auto makeWebSocketSessionFactory() -> std::shared_ptr<UpstreamSessionFactory> {
    return std::make_shared<WebSocketSessionFactory>();
}

} // namespace HC::Upstream
