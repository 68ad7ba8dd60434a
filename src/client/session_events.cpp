#include "client/session_events.hpp"

namespace peerdrop {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BOOTSTRAP: return "BOOTSTRAP";
        case ErrorKind::DECODE: return "DECODE";
        case ErrorKind::SEND: return "SEND";
        case ErrorKind::QUEUE_FULL: return "QUEUE_FULL";
        case ErrorKind::TRANSFER: return "TRANSFER";
        case ErrorKind::CONNECTION_LOST: return "CONNECTION_LOST";
        default: return "UNKNOWN";
    }
}

std::string session_error_message(const SessionError& error) {
    std::string text = error_kind_name(error.kind);
    if (!error.detail.empty()) {
        text += ": " + error.detail;
    }
    return text;
}

const char* event_name(const SessionEvent& event) {
    switch (event.index()) {
        case 0: return "BootstrapSucceeded";
        case 1: return "BootstrapFailed";
        case 2: return "ReadyToRegister";
        case 3: return "MessageReceived";
        case 4: return "DecodeFailed";
        case 5: return "ChannelClosed";
        case 6: return "SendFailed";
        case 7: return "CommandSubmitted";
        case 8: return "PublishCompleted";
        case 9: return "FileResolved";
        case 10: return "TransferFailed";
        default: return "Unknown";
    }
}

} // namespace peerdrop
