#include "common/ws_client_coro.hpp"
#include "common/log.hpp"
#include <boost/asio/redirect_error.hpp>
#include <regex>

namespace peerdrop {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::SIGNALING_LOGGER);
    return instance;
}

constexpr const char* kUserAgent = "PeerDrop/1.0";
} // anonymous namespace

std::string connect_error_message(const ConnectError& error) {
    std::string prefix;
    switch (error.code) {
        case ConnectErrorCode::INVALID_URL: prefix = "Invalid relay URL"; break;
        case ConnectErrorCode::RESOLVE_FAILED: prefix = "Failed to resolve relay host"; break;
        case ConnectErrorCode::CONNECT_FAILED: prefix = "Failed to connect to relay"; break;
        case ConnectErrorCode::TLS_FAILED: prefix = "TLS handshake with relay failed"; break;
        case ConnectErrorCode::HANDSHAKE_FAILED: prefix = "WebSocket handshake with relay failed"; break;
        default: prefix = "Relay connection error"; break;
    }
    return error.detail.empty() ? prefix : prefix + ": " + error.detail;
}

WsClientCoro::WsClientCoro(Private, net::any_io_executor ex, const RelayConfig& config,
                           UrlComponents parts)
    : ex_(std::move(ex))
    , url_(config.url)
    , url_parts_(std::move(parts))
{
    ssl_ctx_.set_default_verify_paths();

    if (config.ssl_verify) {
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
        if (!config.ssl_ca_file.empty()) {
            boost::system::error_code ec;
            ssl_ctx_.load_verify_file(config.ssl_ca_file, ec);
            if (ec) {
                logger().warn("Failed to load CA file '{}': {}", config.ssl_ca_file, ec.message());
            }
        }
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

WsClientCoro::~WsClientCoro() = default;

std::optional<WsClientCoro::UrlComponents> WsClientCoro::parse_url(const std::string& url) {
    std::regex url_regex(R"(^(wss?)://([^:/]+)(?::(\d+))?(/.*)?$)");
    std::smatch match;

    if (!std::regex_match(url, match, url_regex)) {
        return std::nullopt;
    }

    UrlComponents parts;
    parts.use_ssl = (match[1].str() == "wss");
    parts.host = match[2].str();
    parts.port = match[3].matched ? match[3].str() : (parts.use_ssl ? "443" : "80");
    parts.path = match[4].matched ? match[4].str() : "/";

    return parts;
}

net::awaitable<std::expected<std::shared_ptr<WsClientCoro>, ConnectError>>
WsClientCoro::connect(net::any_io_executor ex, const RelayConfig& config) {
    auto parts = parse_url(config.url);
    if (!parts) {
        co_return std::unexpected(ConnectError{ConnectErrorCode::INVALID_URL, config.url});
    }

    auto client = std::make_shared<WsClientCoro>(Private{}, ex, config, *parts);
    auto& p = client->url_parts_;
    boost::system::error_code ec;

    tcp::resolver resolver(ex);
    auto endpoints = co_await resolver.async_resolve(
        p.host, p.port, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(ConnectError{ConnectErrorCode::RESOLVE_FAILED, ec.message()});
    }

    auto decorate = [](websocket::request_type& req) {
        req.set(boost::beast::http::field::user_agent, kUserAgent);
    };

    if (p.use_ssl) {
        client->wss_ = std::make_unique<WssStream>(ex, client->ssl_ctx_);
        auto& wss = *client->wss_;

        // SNI hostname
        if (!SSL_set_tlsext_host_name(wss.next_layer().native_handle(), p.host.c_str())) {
            co_return std::unexpected(ConnectError{ConnectErrorCode::TLS_FAILED, "failed to set SNI host name"});
        }

        co_await net::async_connect(beast::get_lowest_layer(wss), endpoints,
                                    net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(ConnectError{ConnectErrorCode::CONNECT_FAILED, ec.message()});
        }

        co_await wss.next_layer().async_handshake(ssl::stream_base::client,
                                                  net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(ConnectError{ConnectErrorCode::TLS_FAILED, ec.message()});
        }

        wss.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        wss.set_option(websocket::stream_base::decorator(decorate));
        co_await wss.async_handshake(p.host, p.path, net::redirect_error(net::use_awaitable, ec));
    } else {
        client->ws_ = std::make_unique<WsStream>(ex);
        auto& ws = *client->ws_;

        co_await net::async_connect(beast::get_lowest_layer(ws), endpoints,
                                    net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(ConnectError{ConnectErrorCode::CONNECT_FAILED, ec.message()});
        }

        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator(decorate));
        co_await ws.async_handshake(p.host, p.path, net::redirect_error(net::use_awaitable, ec));
    }

    if (ec) {
        co_return std::unexpected(ConnectError{ConnectErrorCode::HANDSHAKE_FAILED, ec.message()});
    }

    logger().info("Connected to {}", client->url_);
    co_return client;
}

net::awaitable<std::optional<std::string>> WsClientCoro::read_frame() {
    if (!ws_ && !wss_) {
        co_return std::nullopt;
    }

    read_buffer_.clear();
    boost::system::error_code ec;
    size_t bytes = 0;

    if (wss_) {
        bytes = co_await wss_->async_read(read_buffer_, net::redirect_error(net::use_awaitable, ec));
    } else {
        bytes = co_await ws_->async_read(read_buffer_, net::redirect_error(net::use_awaitable, ec));
    }

    if (ec == websocket::error::closed) {
        logger().info("{}: closed by relay", url_);
        co_return std::nullopt;
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }

    bytes_received_.fetch_add(bytes, std::memory_order_relaxed);
    frames_received_.fetch_add(1, std::memory_order_relaxed);

    std::string frame = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    logger().trace("{}: RX {} bytes", url_, frame.size());
    co_return frame;
}

net::awaitable<std::expected<void, SendError>> WsClientCoro::write_frame(std::string frame) {
    if (!ws_ && !wss_) {
        co_return std::unexpected(SendError{"not connected"});
    }

    boost::system::error_code ec;
    size_t bytes = 0;

    if (wss_) {
        wss_->text(true);
        bytes = co_await wss_->async_write(net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
    } else {
        ws_->text(true);
        bytes = co_await ws_->async_write(net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
    }

    if (ec) {
        logger().warn("{}: write failed: {}", url_, ec.message());
        co_return std::unexpected(SendError{ec.message()});
    }

    bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
    frames_sent_.fetch_add(1, std::memory_order_relaxed);
    logger().trace("{}: TX {} bytes", url_, bytes);
    co_return std::expected<void, SendError>{};
}

net::awaitable<void> WsClientCoro::close() {
    boost::system::error_code ec;

    if (wss_ && wss_->is_open()) {
        co_await wss_->async_close(websocket::close_code::normal,
                                   net::redirect_error(net::use_awaitable, ec));
    } else if (ws_ && ws_->is_open()) {
        co_await ws_->async_close(websocket::close_code::normal,
                                  net::redirect_error(net::use_awaitable, ec));
    }

    if (ec) {
        logger().debug("{}: close: {}", url_, ec.message());
    }
}

WsClientCoro::Stats WsClientCoro::stats() const {
    Stats s;
    s.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
    s.bytes_received = bytes_received_.load(std::memory_order_relaxed);
    s.frames_sent = frames_sent_.load(std::memory_order_relaxed);
    s.frames_received = frames_received_.load(std::memory_order_relaxed);
    return s;
}

} // namespace peerdrop
