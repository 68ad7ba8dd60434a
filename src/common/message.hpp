#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace peerdrop {

// ============================================================================
// Signaling Messages
// ============================================================================
//
// One JSON object per WebSocket text frame, adjacently tagged:
//   {"type": "<tag>", "payload": <payload>}
// Variants without a payload omit the "payload" member.
//

// register: client -> relay
struct Register {
    std::string nickname;
    bool operator==(const Register&) const = default;
};

// register_success: relay -> client
struct RegisterSuccess {
    bool operator==(const RegisterSuccess&) const = default;
};

// disconnect_user: client -> relay
struct DisconnectUser {
    std::string nickname;
    bool operator==(const DisconnectUser&) const = default;
};

// get_active_users_list: client -> relay
struct GetActiveUsersList {
    std::string nickname;
    bool operator==(const GetActiveUsersList&) const = default;
};

// active_users_list: relay -> client, full roster
struct ActiveUsersList {
    std::vector<std::string> nicknames;
    bool operator==(const ActiveUsersList&) const = default;
};

// send_file: client -> relay -> peer
struct SendFile {
    std::string ticket;
    bool operator==(const SendFile&) const = default;
};

// receive_file: relay -> client
struct ReceiveFile {
    std::string ticket;
    bool operator==(const ReceiveFile&) const = default;
};

// error_deserializing_json: relay -> client
struct ErrorDeserializingJson {
    std::string detail;
    bool operator==(const ErrorDeserializingJson&) const = default;
};

using Message = std::variant<
    Register,
    RegisterSuccess,
    DisconnectUser,
    GetActiveUsersList,
    ActiveUsersList,
    SendFile,
    ReceiveFile,
    ErrorDeserializingJson>;

// Wire tag of a message, e.g. "register_success"
std::string_view message_type_name(const Message& message);

// ============================================================================
// Codec
// ============================================================================

enum class DecodeErrorCode {
    INVALID_JSON,
    NOT_AN_OBJECT,
    MISSING_TAG,
    UNKNOWN_TAG,
    INVALID_PAYLOAD,
};

struct DecodeError {
    DecodeErrorCode code = DecodeErrorCode::INVALID_JSON;
    std::string detail;
};

std::string decode_error_message(const DecodeError& error);

// Never fails
std::string encode(const Message& message);

// Never throws; every malformed input yields a DecodeError
std::expected<Message, DecodeError> decode(std::string_view text);

} // namespace peerdrop
