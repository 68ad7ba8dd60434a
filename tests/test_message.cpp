#include <gtest/gtest.h>
#include "common/message.hpp"

using namespace peerdrop;

class MessageTest : public ::testing::Test {
protected:
    static Message roundtrip(const Message& message) {
        auto decoded = decode(encode(message));
        EXPECT_TRUE(decoded.has_value()) << encode(message);
        return decoded.value_or(RegisterSuccess{});
    }

    static DecodeErrorCode error_of(std::string_view text) {
        auto decoded = decode(text);
        EXPECT_FALSE(decoded.has_value()) << text;
        return decoded ? DecodeErrorCode::INVALID_JSON : decoded.error().code;
    }
};

// ============================================================================
// Round trip
// ============================================================================

TEST_F(MessageTest, EveryVariantRoundTrips) {
    std::vector<Message> messages = {
        Register{"guest42"},
        RegisterSuccess{},
        DisconnectUser{"guest42"},
        GetActiveUsersList{"guest42"},
        ActiveUsersList{{"alice", "bob", "carol"}},
        ActiveUsersList{{}},
        SendFile{"blobabc"},
        ReceiveFile{"blobdef"},
        ErrorDeserializingJson{"expected value at line 1"},
    };

    for (const auto& message : messages) {
        EXPECT_EQ(roundtrip(message), message) << message_type_name(message);
    }
}

TEST_F(MessageTest, UnicodeAndEscapesSurvive) {
    Message message = Register{"jörg \"the\" \\ user"};
    EXPECT_EQ(roundtrip(message), message);
}

// ============================================================================
// Wire format
// ============================================================================

TEST_F(MessageTest, RegisterWireShape) {
    EXPECT_EQ(encode(Register{"guest42"}),
              R"({"type":"register","payload":{"nickname":"guest42"}})");
}

TEST_F(MessageTest, UnitVariantOmitsPayload) {
    EXPECT_EQ(encode(RegisterSuccess{}), R"({"type":"register_success"})");
}

TEST_F(MessageTest, StringPayloadIsBare) {
    EXPECT_EQ(encode(SendFile{"blobxyz"}), R"({"type":"send_file","payload":"blobxyz"})");
    EXPECT_EQ(encode(DisconnectUser{"n"}), R"({"type":"disconnect_user","payload":"n"})");
}

TEST_F(MessageTest, DecodesRelayFrames) {
    auto list = decode(R"({"type":"active_users_list","payload":["a","b"]})");
    ASSERT_TRUE(list.has_value());
    auto* users = std::get_if<ActiveUsersList>(&*list);
    ASSERT_NE(users, nullptr);
    EXPECT_EQ(users->nicknames, (std::vector<std::string>{"a", "b"}));

    auto ack = decode(R"({"type":"register_success","payload":null})");
    ASSERT_TRUE(ack.has_value());
    EXPECT_TRUE(std::holds_alternative<RegisterSuccess>(*ack));
}

TEST_F(MessageTest, MemberOrderAndExtraMembersAreIrrelevant) {
    auto msg = decode(R"({"payload":"blob1","extra":1,"type":"receive_file"})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, Message{ReceiveFile{"blob1"}});
}

TEST_F(MessageTest, TypeNames) {
    EXPECT_EQ(message_type_name(Register{}), "register");
    EXPECT_EQ(message_type_name(ErrorDeserializingJson{}), "error_deserializing_json");
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_F(MessageTest, MalformedJson) {
    EXPECT_EQ(error_of(""), DecodeErrorCode::INVALID_JSON);
    EXPECT_EQ(error_of("{"), DecodeErrorCode::INVALID_JSON);
    EXPECT_EQ(error_of("not json"), DecodeErrorCode::INVALID_JSON);
    EXPECT_EQ(error_of(std::string_view("\xff\xfe\x00", 3)), DecodeErrorCode::INVALID_JSON);
}

TEST_F(MessageTest, NonObjectRoot) {
    EXPECT_EQ(error_of("[]"), DecodeErrorCode::NOT_AN_OBJECT);
    EXPECT_EQ(error_of("\"register\""), DecodeErrorCode::NOT_AN_OBJECT);
    EXPECT_EQ(error_of("42"), DecodeErrorCode::NOT_AN_OBJECT);
}

TEST_F(MessageTest, MissingOrNonStringTag) {
    EXPECT_EQ(error_of("{}"), DecodeErrorCode::MISSING_TAG);
    EXPECT_EQ(error_of(R"({"payload":"x"})"), DecodeErrorCode::MISSING_TAG);
    EXPECT_EQ(error_of(R"({"type":7})"), DecodeErrorCode::MISSING_TAG);
}

TEST_F(MessageTest, UnknownTag) {
    auto decoded = decode(R"({"type":"teleport","payload":"x"})");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, DecodeErrorCode::UNKNOWN_TAG);
    EXPECT_EQ(decoded.error().detail, "teleport");
}

TEST_F(MessageTest, PayloadShapeIsValidated) {
    EXPECT_EQ(error_of(R"({"type":"register","payload":"guest"})"), DecodeErrorCode::INVALID_PAYLOAD);
    EXPECT_EQ(error_of(R"({"type":"register","payload":{}})"), DecodeErrorCode::INVALID_PAYLOAD);
    EXPECT_EQ(error_of(R"({"type":"register","payload":{"nickname":1}})"), DecodeErrorCode::INVALID_PAYLOAD);
    EXPECT_EQ(error_of(R"({"type":"register_success","payload":"x"})"), DecodeErrorCode::INVALID_PAYLOAD);
    EXPECT_EQ(error_of(R"({"type":"send_file"})"), DecodeErrorCode::INVALID_PAYLOAD);
    EXPECT_EQ(error_of(R"({"type":"send_file","payload":["x"]})"), DecodeErrorCode::INVALID_PAYLOAD);
    EXPECT_EQ(error_of(R"({"type":"active_users_list","payload":"a"})"), DecodeErrorCode::INVALID_PAYLOAD);
    EXPECT_EQ(error_of(R"({"type":"active_users_list","payload":["a",2]})"), DecodeErrorCode::INVALID_PAYLOAD);
}

TEST_F(MessageTest, DecodeErrorMessageIncludesDetail) {
    DecodeError error{DecodeErrorCode::UNKNOWN_TAG, "teleport"};
    EXPECT_EQ(decode_error_message(error), "Unknown message type: teleport");
}
