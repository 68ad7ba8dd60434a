#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace peerdrop::crypto {

inline constexpr size_t NODE_ID_SIZE = 32;        // Ed25519 public key
inline constexpr size_t NODE_SECRET_SIZE = 64;    // Ed25519 secret key (seed + pk)
inline constexpr size_t SIGNATURE_SIZE = 64;
inline constexpr size_t BLOB_HASH_SIZE = 32;      // BLAKE2b-256
inline constexpr size_t NONCE_SIZE = 32;

using NodeId = std::array<uint8_t, NODE_ID_SIZE>;
using NodeSecret = std::array<uint8_t, NODE_SECRET_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;
using BlobHash = std::array<uint8_t, BLOB_HASH_SIZE>;
using Nonce = std::array<uint8_t, NONCE_SIZE>;

enum class CryptoError {
    INIT_FAILED,
    KEY_GENERATION_FAILED,
    SIGN_FAILED,
    HASH_FAILED,
};

std::string crypto_error_message(CryptoError error);

// Initialize libsodium. Safe to call more than once.
bool init();

// ============================================================================
// Node identity (Ed25519)
// ============================================================================

struct NodeKey {
    NodeId public_key{};
    NodeSecret secret_key{};
};

std::expected<NodeKey, CryptoError> generate_node_key();

std::expected<Signature, CryptoError> sign(
    std::span<const uint8_t> message,
    const NodeSecret& secret_key);

bool verify(
    std::span<const uint8_t> message,
    const Signature& signature,
    const NodeId& public_key);

// ============================================================================
// Content addressing
// ============================================================================

std::expected<BlobHash, CryptoError> blob_hash(std::span<const uint8_t> content);

std::expected<Nonce, CryptoError> random_nonce();

// Short printable form of a node id for logs (first 5 bytes, hex)
std::string short_id(const NodeId& id);

} // namespace peerdrop::crypto
