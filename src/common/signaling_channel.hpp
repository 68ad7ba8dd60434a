#pragma once

#include <boost/asio/awaitable.hpp>
#include <expected>
#include <optional>
#include <string>

namespace peerdrop {

namespace net = boost::asio;

enum class ConnectErrorCode {
    INVALID_URL,
    RESOLVE_FAILED,
    CONNECT_FAILED,
    TLS_FAILED,
    HANDSHAKE_FAILED,
};

struct ConnectError {
    ConnectErrorCode code = ConnectErrorCode::CONNECT_FAILED;
    std::string detail;
};

std::string connect_error_message(const ConnectError& error);

struct SendError {
    std::string detail;
};

/**
 * SignalingChannel - duplex, message-oriented connection to the relay.
 *
 * One reader and one writer may use the channel concurrently. Frames are
 * delivered to the transport in the order write_frame() is called.
 * No retry happens at this layer.
 */
class SignalingChannel {
public:
    virtual ~SignalingChannel() = default;

    /**
     * Next inbound frame.
     * @return nullopt once the relay closed the connection; I/O failures
     *         throw boost::system::system_error
     */
    virtual net::awaitable<std::optional<std::string>> read_frame() = 0;

    virtual net::awaitable<std::expected<void, SendError>> write_frame(std::string frame) = 0;

    // Graceful close; errors are logged, not reported
    virtual net::awaitable<void> close() = 0;

    virtual std::string describe() const = 0;
};

} // namespace peerdrop
