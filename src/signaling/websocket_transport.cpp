#include "lanbeam/signaling/relay_transport.hpp"
#include "lanbeam/transport/channel_reader.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <deque>
#include <thread>
#include <type_traits>

namespace lanbeam::signaling {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

using PlainStream = websocket::stream<beast::tcp_stream>;
using SecureStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// ──────────────────────────────────────────────────────────
// WebSocketConnection
// ──────────────────────────────────────────────────────────

template<typename Stream>
class WebSocketConnection : public RelayConnection {
public:
    WebSocketConnection()
        : ssl_context_(ssl::context::tls_client),
          ws_(make_stream()) {}

    ~WebSocketConnection() override {
        close();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    Result<void> establish(const RelayEndpoint& endpoint) {
        beast::error_code ec;
        tcp::resolver resolver(io_);
        const auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
        if (ec) {
            return Err<void>(ErrorKind::RelayRecoverable, "resolve " + endpoint.host + ": " + ec.message());
        }

        beast::get_lowest_layer(*ws_).connect(results, ec);
        if (ec) {
            return Err<void>(ErrorKind::RelayRecoverable, "connect " + endpoint.host + ": " + ec.message());
        }

        if constexpr (std::is_same_v<Stream, SecureStream>) {
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint.host.c_str())) {
                return Err<void>(ErrorKind::RelayRecoverable, "failed to set TLS server name");
            }
            ws_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));
            ws_->next_layer().handshake(ssl::stream_base::client, ec);
            if (ec) {
                return Err<void>(ErrorKind::RelayRecoverable, "TLS handshake: " + ec.message());
            }
        }

        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->handshake(endpoint.host + ":" + endpoint.port, endpoint.target, ec);
        if (ec) {
            return Err<void>(ErrorKind::RelayRecoverable, "websocket handshake: " + ec.message());
        }
        ws_->text(true);
        return Ok();
    }

    void start() {
        do_read();
        io_thread_ = std::thread([this]() { io_.run(); });
    }

    Result<std::optional<std::string>> read(std::chrono::milliseconds timeout) override {
        auto frame = inbound_.read_next_for(timeout);
        if (frame) {
            return Ok(std::move(frame));
        }
        if (inbound_.closed()) {
            return Err<std::optional<std::string>>(ErrorKind::RelayRecoverable, "relay connection closed");
        }
        return Ok(std::optional<std::string>{});
    }

    Result<void> write(const std::string& text) override {
        if (inbound_.closed() || closing_) {
            return Err<void>(ErrorKind::RelayRecoverable, "relay connection closed");
        }
        asio::post(io_, [this, text]() {
            outbox_.push_back(text);
            if (outbox_.size() == 1) {
                do_write();
            }
        });
        return Ok();
    }

    void close() override {
        if (closing_.exchange(true)) {
            return;
        }
        asio::post(io_, [this]() {
            // A close frame must not overlap a pending write
            if (outbox_.empty()) {
                do_close();
            }
        });
    }

private:
    std::unique_ptr<Stream> make_stream() {
        if constexpr (std::is_same_v<Stream, SecureStream>) {
            ssl_context_.set_default_verify_paths();
            ssl_context_.set_verify_mode(ssl::verify_peer);
            return std::make_unique<Stream>(io_, ssl_context_);
        } else {
            return std::make_unique<Stream>(io_);
        }
    }

    void do_read() {
        ws_->async_read(buffer_, [this](beast::error_code ec, std::size_t) {
            if (ec) {
                fail(ec);
                return;
            }
            inbound_.append(beast::buffers_to_string(buffer_.data()));
            buffer_.consume(buffer_.size());
            do_read();
        });
    }

    void do_write() {
        ws_->async_write(asio::buffer(outbox_.front()), [this](beast::error_code ec, std::size_t) {
            if (ec) {
                fail(ec);
                return;
            }
            outbox_.pop_front();
            if (!outbox_.empty()) {
                do_write();
            } else if (closing_) {
                do_close();
            }
        });
    }

    void do_close() {
        ws_->async_close(websocket::close_code::normal, [this](beast::error_code ec) {
            if (ec) {
                spdlog::debug("[WebSocket] close: {}", ec.message());
            }
            inbound_.close();
        });
    }

    void fail(beast::error_code ec) {
        if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
            spdlog::warn("[WebSocket] connection error: {}", ec.message());
        }
        inbound_.close();
    }

    asio::io_context io_;
    ssl::context ssl_context_;
    std::unique_ptr<Stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    transport::AsyncChannelReader<std::string> inbound_;
    std::atomic<bool> closing_{false};
    std::thread io_thread_;
};

template<typename Stream>
Result<std::unique_ptr<RelayConnection>> open_stream(const RelayEndpoint& endpoint) {
    auto connection = std::make_unique<WebSocketConnection<Stream>>();
    if (auto established = connection->establish(endpoint); established.is_error()) {
        return Err<std::unique_ptr<RelayConnection>>(established.error());
    }
    connection->start();
    return Ok(std::unique_ptr<RelayConnection>(std::move(connection)));
}

} // namespace

Result<RelayEndpoint> parse_relay_url(const std::string& url) {
    RelayEndpoint endpoint;
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        endpoint.secure = true;
        endpoint.port = "443";
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        endpoint.secure = false;
        endpoint.port = "80";
        rest = url.substr(5);
    } else {
        return Err<RelayEndpoint>(ErrorKind::InvalidArgument, "relay URL must use ws:// or wss://: " + url);
    }

    const auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    endpoint.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (!endpoint.target.empty() && endpoint.target.front() == '?') {
        endpoint.target.insert(endpoint.target.begin(), '/');
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        endpoint.port = authority.substr(colon + 1);
        authority.resize(colon);
    }
    if (authority.empty()) {
        return Err<RelayEndpoint>(ErrorKind::InvalidArgument, "relay URL has no host: " + url);
    }
    if (endpoint.port.empty() || endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
        return Err<RelayEndpoint>(ErrorKind::InvalidArgument, "relay URL has an invalid port: " + url);
    }
    endpoint.host = std::move(authority);
    return Ok(std::move(endpoint));
}

Result<std::unique_ptr<RelayConnection>> WebSocketRelayTransport::open(const std::string& url) {
    auto endpoint = parse_relay_url(url);
    if (endpoint.is_error()) {
        return Err<std::unique_ptr<RelayConnection>>(endpoint.error());
    }
    spdlog::info("[WebSocket] connecting host={} port={} tls={}",
                 endpoint.value().host, endpoint.value().port, endpoint.value().secure);
    if (endpoint.value().secure) {
        return open_stream<SecureStream>(endpoint.value());
    }
    return open_stream<PlainStream>(endpoint.value());
}

} // namespace lanbeam::signaling
