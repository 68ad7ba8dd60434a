#include "common/message.hpp"
#include <boost/json.hpp>

namespace json = boost::json;

namespace peerdrop {

namespace {

constexpr const char* kTypeKey = "type";
constexpr const char* kPayloadKey = "payload";

std::unexpected<DecodeError> fail(DecodeErrorCode code, std::string detail) {
    return std::unexpected(DecodeError{code, std::move(detail)});
}

std::string to_std_string(const json::string& s) {
    return std::string(s.data(), s.size());
}

// Payload accessors: nullptr when the member is absent
const json::value* find_payload(const json::object& obj) {
    auto it = obj.find(kPayloadKey);
    return it == obj.end() ? nullptr : &it->value();
}

std::expected<std::string, DecodeError> string_payload(const json::object& obj,
                                                       std::string_view tag) {
    const auto* payload = find_payload(obj);
    if (!payload || !payload->is_string()) {
        return fail(DecodeErrorCode::INVALID_PAYLOAD,
                    std::string(tag) + ": payload must be a string");
    }
    return to_std_string(payload->as_string());
}

json::object tagged(std::string_view tag) {
    json::object obj;
    obj[kTypeKey] = json::string(tag.data(), tag.size());
    return obj;
}

json::object tagged(std::string_view tag, json::value payload) {
    json::object obj = tagged(tag);
    obj[kPayloadKey] = std::move(payload);
    return obj;
}

struct Encoder {
    json::object operator()(const Register& m) const {
        json::object payload;
        payload["nickname"] = json::string(m.nickname.data(), m.nickname.size());
        return tagged("register", std::move(payload));
    }
    json::object operator()(const RegisterSuccess&) const {
        return tagged("register_success");
    }
    json::object operator()(const DisconnectUser& m) const {
        return tagged("disconnect_user", json::string(m.nickname.data(), m.nickname.size()));
    }
    json::object operator()(const GetActiveUsersList& m) const {
        return tagged("get_active_users_list", json::string(m.nickname.data(), m.nickname.size()));
    }
    json::object operator()(const ActiveUsersList& m) const {
        json::array names;
        names.reserve(m.nicknames.size());
        for (const auto& name : m.nicknames) {
            names.emplace_back(json::string(name.data(), name.size()));
        }
        return tagged("active_users_list", std::move(names));
    }
    json::object operator()(const SendFile& m) const {
        return tagged("send_file", json::string(m.ticket.data(), m.ticket.size()));
    }
    json::object operator()(const ReceiveFile& m) const {
        return tagged("receive_file", json::string(m.ticket.data(), m.ticket.size()));
    }
    json::object operator()(const ErrorDeserializingJson& m) const {
        return tagged("error_deserializing_json", json::string(m.detail.data(), m.detail.size()));
    }
};

std::expected<Message, DecodeError> decode_register(const json::object& obj) {
    const auto* payload = find_payload(obj);
    if (!payload || !payload->is_object()) {
        return fail(DecodeErrorCode::INVALID_PAYLOAD, "register: payload must be an object");
    }
    const auto& fields = payload->as_object();
    auto it = fields.find("nickname");
    if (it == fields.end() || !it->value().is_string()) {
        return fail(DecodeErrorCode::INVALID_PAYLOAD, "register: missing string field 'nickname'");
    }
    return Register{to_std_string(it->value().as_string())};
}

std::expected<Message, DecodeError> decode_register_success(const json::object& obj) {
    const auto* payload = find_payload(obj);
    if (payload && !payload->is_null()) {
        return fail(DecodeErrorCode::INVALID_PAYLOAD, "register_success: unexpected payload");
    }
    return RegisterSuccess{};
}

std::expected<Message, DecodeError> decode_active_users(const json::object& obj) {
    const auto* payload = find_payload(obj);
    if (!payload || !payload->is_array()) {
        return fail(DecodeErrorCode::INVALID_PAYLOAD, "active_users_list: payload must be an array");
    }
    ActiveUsersList list;
    for (const auto& item : payload->as_array()) {
        if (!item.is_string()) {
            return fail(DecodeErrorCode::INVALID_PAYLOAD,
                        "active_users_list: every entry must be a string");
        }
        list.nicknames.push_back(to_std_string(item.as_string()));
    }
    return list;
}

// Wraps a string payload into the variant alternative T
template<typename T>
std::expected<Message, DecodeError> decode_string_variant(const json::object& obj,
                                                          std::string_view tag) {
    auto text = string_payload(obj, tag);
    if (!text) {
        return std::unexpected(text.error());
    }
    return T{std::move(*text)};
}

} // anonymous namespace

std::string_view message_type_name(const Message& message) {
    switch (message.index()) {
        case 0: return "register";
        case 1: return "register_success";
        case 2: return "disconnect_user";
        case 3: return "get_active_users_list";
        case 4: return "active_users_list";
        case 5: return "send_file";
        case 6: return "receive_file";
        case 7: return "error_deserializing_json";
        default: return "unknown";
    }
}

std::string decode_error_message(const DecodeError& error) {
    std::string prefix;
    switch (error.code) {
        case DecodeErrorCode::INVALID_JSON: prefix = "Invalid JSON"; break;
        case DecodeErrorCode::NOT_AN_OBJECT: prefix = "Message is not a JSON object"; break;
        case DecodeErrorCode::MISSING_TAG: prefix = "Missing message type"; break;
        case DecodeErrorCode::UNKNOWN_TAG: prefix = "Unknown message type"; break;
        case DecodeErrorCode::INVALID_PAYLOAD: prefix = "Invalid payload"; break;
        default: prefix = "Decode error"; break;
    }
    if (error.detail.empty()) {
        return prefix;
    }
    return prefix + ": " + error.detail;
}

std::string encode(const Message& message) {
    return json::serialize(std::visit(Encoder{}, message));
}

std::expected<Message, DecodeError> decode(std::string_view text) {
    boost::system::error_code ec;
    json::value root = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) {
        return fail(DecodeErrorCode::INVALID_JSON, ec.message());
    }
    if (!root.is_object()) {
        return fail(DecodeErrorCode::NOT_AN_OBJECT, {});
    }

    const auto& obj = root.as_object();
    auto type_it = obj.find(kTypeKey);
    if (type_it == obj.end() || !type_it->value().is_string()) {
        return fail(DecodeErrorCode::MISSING_TAG, {});
    }

    const std::string tag = to_std_string(type_it->value().as_string());

    if (tag == "register") return decode_register(obj);
    if (tag == "register_success") return decode_register_success(obj);
    if (tag == "disconnect_user") return decode_string_variant<DisconnectUser>(obj, tag);
    if (tag == "get_active_users_list") return decode_string_variant<GetActiveUsersList>(obj, tag);
    if (tag == "active_users_list") return decode_active_users(obj);
    if (tag == "send_file") return decode_string_variant<SendFile>(obj, tag);
    if (tag == "receive_file") return decode_string_variant<ReceiveFile>(obj, tag);
    if (tag == "error_deserializing_json") return decode_string_variant<ErrorDeserializingJson>(obj, tag);

    return fail(DecodeErrorCode::UNKNOWN_TAG, tag);
}

} // namespace peerdrop
