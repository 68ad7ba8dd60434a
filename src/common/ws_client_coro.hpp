#pragma once

#include "common/config.hpp"
#include "common/signaling_channel.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace peerdrop {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

/**
 * WsClientCoro - coroutine-based WebSocket connection to the signaling relay.
 *
 * Supports ws:// and wss:// (OpenSSL, SNI, optional peer verification).
 * A connection is established once by connect(); when it ends the object is
 * spent and a new one must be created.
 */
class WsClientCoro : public SignalingChannel {
    struct Private {};

public:
    struct UrlComponents {
        std::string host;
        std::string port;
        std::string path;
        bool use_ssl{false};
    };

    struct Stats {
        uint64_t bytes_sent{0};
        uint64_t bytes_received{0};
        uint64_t frames_sent{0};
        uint64_t frames_received{0};
    };

    /**
     * Resolve, connect, TLS handshake (wss only) and WebSocket handshake.
     */
    static net::awaitable<std::expected<std::shared_ptr<WsClientCoro>, ConnectError>>
    connect(net::any_io_executor ex, const RelayConfig& config);

    // Pattern: wss?://host[:port][/path]
    static std::optional<UrlComponents> parse_url(const std::string& url);

    WsClientCoro(Private, net::any_io_executor ex, const RelayConfig& config, UrlComponents parts);
    ~WsClientCoro() override;

    WsClientCoro(const WsClientCoro&) = delete;
    WsClientCoro& operator=(const WsClientCoro&) = delete;

    // SignalingChannel
    net::awaitable<std::optional<std::string>> read_frame() override;
    net::awaitable<std::expected<void, SendError>> write_frame(std::string frame) override;
    net::awaitable<void> close() override;
    std::string describe() const override { return url_; }

    Stats stats() const;

private:
    net::any_io_executor ex_;
    std::string url_;
    UrlComponents url_parts_;

    ssl::context ssl_ctx_{ssl::context::tlsv12_client};

    // WebSocket streams (one active at a time)
    using WssStream = websocket::stream<ssl::stream<tcp::socket>>;
    using WsStream = websocket::stream<tcp::socket>;
    std::unique_ptr<WssStream> wss_;
    std::unique_ptr<WsStream> ws_;

    beast::flat_buffer read_buffer_;

    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_received_{0};
};

} // namespace peerdrop
