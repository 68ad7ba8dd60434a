#include "common/crypto.hpp"
#include "common/binary_codec.hpp"
#include <sodium.h>

namespace peerdrop::crypto {

std::string crypto_error_message(CryptoError error) {
    switch (error) {
        case CryptoError::INIT_FAILED: return "Crypto initialization failed";
        case CryptoError::KEY_GENERATION_FAILED: return "Key generation failed";
        case CryptoError::SIGN_FAILED: return "Signing failed";
        case CryptoError::HASH_FAILED: return "Hashing failed";
        default: return "Unknown crypto error";
    }
}

bool init() {
    // sodium_init returns 1 when already initialized
    return sodium_init() >= 0;
}

// ============================================================================
// Ed25519
// ============================================================================

std::expected<NodeKey, CryptoError> generate_node_key() {
    if (!init()) {
        return std::unexpected(CryptoError::INIT_FAILED);
    }

    NodeKey key;
    if (crypto_sign_keypair(key.public_key.data(), key.secret_key.data()) != 0) {
        return std::unexpected(CryptoError::KEY_GENERATION_FAILED);
    }
    return key;
}

std::expected<Signature, CryptoError> sign(
    std::span<const uint8_t> message,
    const NodeSecret& secret_key) {

    Signature signature;
    unsigned long long sig_len = 0;

    if (crypto_sign_detached(signature.data(), &sig_len,
                             message.data(), message.size(),
                             secret_key.data()) != 0) {
        return std::unexpected(CryptoError::SIGN_FAILED);
    }
    return signature;
}

bool verify(
    std::span<const uint8_t> message,
    const Signature& signature,
    const NodeId& public_key) {

    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       public_key.data()) == 0;
}

// ============================================================================
// BLAKE2b-256 content hash
// ============================================================================

std::expected<BlobHash, CryptoError> blob_hash(std::span<const uint8_t> content) {
    BlobHash hash;
    if (crypto_generichash(hash.data(), hash.size(),
                           content.data(), content.size(),
                           nullptr, 0) != 0) {
        return std::unexpected(CryptoError::HASH_FAILED);
    }
    return hash;
}

std::expected<Nonce, CryptoError> random_nonce() {
    if (!init()) {
        return std::unexpected(CryptoError::INIT_FAILED);
    }
    Nonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

std::string short_id(const NodeId& id) {
    return wire::hex_encode(std::span<const uint8_t>(id.data(), 5));
}

} // namespace peerdrop::crypto
