#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <expected>

namespace peerdrop {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Sections
// ============================================================================

struct RelayConfig {
    // ws://host[:port][/path] or wss://...
    std::string url = "ws://127.0.0.1:4001/ws";
    bool ssl_verify = true;
    std::string ssl_ca_file;            // empty = system default
};

struct TransferConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;                  // 0 = ephemeral
    // host:port strings written into tickets; empty = derived from bind address
    std::vector<std::string> advertise_addresses;
    std::string download_dir;           // empty = <temp>/peerdrop
    uint64_t max_blob_size = 1ull << 30;
};

struct SessionConfig {
    std::string nickname;               // empty = generated
    size_t event_queue_capacity = 100;
    size_t outbound_queue_capacity = 100;
};

// ============================================================================
// PeerDrop Configuration
// ============================================================================

struct PeerDropConfig {
    RelayConfig relay;
    TransferConfig transfer;
    SessionConfig session;

    std::string log_level = "info";
    std::string log_file;

    // Rejects values the session cannot start with
    std::expected<void, ConfigError> validate() const;

    // Load from JSON file
    static std::expected<PeerDropConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<PeerDropConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace peerdrop
