#pragma once

#include "client/transfer_endpoint.hpp"
#include "common/bounded_channel.hpp"
#include "common/message.hpp"
#include "common/signaling_channel.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <variant>

namespace peerdrop {

// ============================================================================
// Session Errors
// ============================================================================

enum class ErrorKind {
    BOOTSTRAP,          // fatal
    DECODE,
    SEND,
    QUEUE_FULL,
    TRANSFER,
    CONNECTION_LOST,    // fatal
};

const char* error_kind_name(ErrorKind kind);

struct SessionError {
    ErrorKind kind = ErrorKind::SEND;
    std::string detail;

    bool fatal() const {
        return kind == ErrorKind::BOOTSTRAP || kind == ErrorKind::CONNECTION_LOST;
    }
};

std::string session_error_message(const SessionError& error);

// ============================================================================
// Commands (front-end -> session)
// ============================================================================

struct SelectFileForTransfer {
    std::filesystem::path path;
};

struct RequestRoster {};

struct PublishToPeer {
    std::string nickname;
};

struct Disconnect {};

using Command = std::variant<
    SelectFileForTransfer,
    RequestRoster,
    PublishToPeer,
    Disconnect>;

// ============================================================================
// Events (background tasks -> session)
// ============================================================================

using OutboundQueue = BoundedChannel<std::string>;

struct BootstrapSucceeded {
    std::shared_ptr<SignalingChannel> channel;
    std::shared_ptr<BlobTransfer> transfer;
    std::shared_ptr<OutboundQueue> outbound;    // receiver handed to the writer
};

struct BootstrapFailed {
    std::string reason;
};

struct ReadyToRegister {};

struct MessageReceived {
    Message message;
};

struct DecodeFailed {
    DecodeError error;
};

struct ChannelClosed {
    std::string reason;
};

struct SendFailed {
    std::string detail;
};

struct CommandSubmitted {
    Command command;
};

struct PublishCompleted {
    std::string ticket;
    std::string peer;
};

struct FileResolved {
    std::filesystem::path path;
};

struct TransferFailed {
    std::string operation;      // "publish" or "resolve"
    TransferError error;
};

using SessionEvent = std::variant<
    BootstrapSucceeded,
    BootstrapFailed,
    ReadyToRegister,
    MessageReceived,
    DecodeFailed,
    ChannelClosed,
    SendFailed,
    CommandSubmitted,
    PublishCompleted,
    FileResolved,
    TransferFailed>;

const char* event_name(const SessionEvent& event);

using EventBus = BoundedChannel<SessionEvent>;

} // namespace peerdrop
