#include <gtest/gtest.h>
#include "common/crypto.hpp"

using namespace peerdrop;
using namespace peerdrop::crypto;

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
    }
};

// Ed25519 Tests
TEST_F(CryptoTest, NodeKeyGeneration) {
    auto key1 = generate_node_key();
    auto key2 = generate_node_key();

    ASSERT_TRUE(key1.has_value());
    ASSERT_TRUE(key2.has_value());
    EXPECT_NE(key1->public_key, key2->public_key);
    EXPECT_NE(key1->public_key, NodeId{});
}

TEST_F(CryptoTest, SignAndVerify) {
    auto key = generate_node_key();
    ASSERT_TRUE(key.has_value());

    std::vector<uint8_t> message = {1, 2, 3, 4, 5};
    auto signature = sign(message, key->secret_key);
    ASSERT_TRUE(signature.has_value());

    EXPECT_TRUE(verify(message, *signature, key->public_key));

    // Tampered message
    message[0] ^= 0xFF;
    EXPECT_FALSE(verify(message, *signature, key->public_key));
}

TEST_F(CryptoTest, VerifyRejectsOtherKey) {
    auto key = generate_node_key();
    auto other = generate_node_key();
    ASSERT_TRUE(key.has_value());
    ASSERT_TRUE(other.has_value());

    std::vector<uint8_t> message = {9, 9, 9};
    auto signature = sign(message, key->secret_key);
    ASSERT_TRUE(signature.has_value());
    EXPECT_FALSE(verify(message, *signature, other->public_key));
}

// Content hash Tests
TEST_F(CryptoTest, BlobHashIsDeterministic) {
    std::vector<uint8_t> a = {'h', 'e', 'l', 'l', 'o'};
    std::vector<uint8_t> b = {'h', 'e', 'l', 'l', 'p'};

    auto h1 = blob_hash(a);
    auto h2 = blob_hash(a);
    auto h3 = blob_hash(b);
    ASSERT_TRUE(h1 && h2 && h3);
    EXPECT_EQ(*h1, *h2);
    EXPECT_NE(*h1, *h3);
}

TEST_F(CryptoTest, BlobHashOfEmptyContent) {
    auto hash = blob_hash({});
    ASSERT_TRUE(hash.has_value());
    EXPECT_NE(*hash, BlobHash{});
}

TEST_F(CryptoTest, RandomNonces) {
    auto n1 = random_nonce();
    auto n2 = random_nonce();
    ASSERT_TRUE(n1 && n2);
    EXPECT_NE(*n1, *n2);
}

TEST_F(CryptoTest, ShortId) {
    NodeId id{};
    id[0] = 0xab;
    id[4] = 0x01;
    EXPECT_EQ(short_id(id), "ab00000001");
}
