#pragma once

#include "client/blob_store.hpp"
#include "client/blob_ticket.hpp"
#include "common/config.hpp"
#include "common/crypto.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace peerdrop {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// ============================================================================
// Transfer Errors
// ============================================================================

enum class TransferErrorCode {
    KEY_SETUP_FAILED,
    BIND_FAILED,
    FILE_UNREADABLE,
    FILE_TOO_LARGE,
    HASH_FAILED,
    INVALID_TICKET,
    PEER_UNREACHABLE,
    NOT_FOUND,
    BAD_RESPONSE,
    VERIFICATION_FAILED,
    WRITE_FAILED,
};

struct TransferError {
    TransferErrorCode code = TransferErrorCode::PEER_UNREACHABLE;
    std::string detail;
};

std::string transfer_error_message(const TransferError& error);

// ============================================================================
// Blob request protocol (TCP, one request per connection)
// ============================================================================
//
// Request:  "PDB1" | version:u8 | hash:32 | nonce:32
// Response: status:u8
//           status == OK: signature:64 over (nonce | hash) | length:u64 | bytes
//

namespace blob_protocol {

inline constexpr std::array<uint8_t, 4> MAGIC = {'P', 'D', 'B', '1'};
inline constexpr uint8_t VERSION = 1;
inline constexpr size_t REQUEST_SIZE = MAGIC.size() + 1 + crypto::BLOB_HASH_SIZE + crypto::NONCE_SIZE;

enum class Status : uint8_t {
    OK = 0,
    NOT_FOUND = 1,
    BAD_REQUEST = 2,
};

} // namespace blob_protocol

// ============================================================================
// BlobTransfer - publish/resolve interface used by the session
// ============================================================================

class BlobTransfer {
public:
    virtual ~BlobTransfer() = default;

    // Read the file, store it, return a ticket another peer can resolve
    virtual net::awaitable<std::expected<std::string, TransferError>>
    publish(std::filesystem::path path) = 0;

    // Fetch the ticket's blob and write it to the download directory
    virtual net::awaitable<std::expected<std::filesystem::path, TransferError>>
    resolve(std::string ticket) = 0;

    virtual void stop() = 0;

    virtual std::string describe() const = 0;
};

/**
 * TransferEndpoint - content-addressed peer-to-peer blob endpoint.
 *
 * Owns an Ed25519 node key, an in-memory BlobStore and a TCP listener that
 * serves the blob request protocol. Tickets carry the node id and the
 * advertised addresses; a fetched blob is accepted only if the serving peer
 * signs the request nonce with the ticket's node key and the content hashes
 * to the ticket's hash.
 *
 * File reads, hashing and download writes run on a small worker pool; the
 * coroutines resume on the endpoint's executor. Fetched blobs are written to
 * the download directory and not kept in memory.
 */
class TransferEndpoint : public BlobTransfer,
                         public std::enable_shared_from_this<TransferEndpoint> {
    struct Private {};

public:
    struct Stats {
        uint64_t blobs_served{0};
        uint64_t bytes_served{0};
        uint64_t blobs_fetched{0};
        uint64_t bytes_fetched{0};
    };

    // Generate the node key, bind the listener and start serving
    static net::awaitable<std::expected<std::shared_ptr<TransferEndpoint>, TransferError>>
    initialize(net::any_io_executor ex, const TransferConfig& config);

    TransferEndpoint(Private, net::any_io_executor ex, TransferConfig config, crypto::NodeKey key);
    ~TransferEndpoint() override;

    TransferEndpoint(const TransferEndpoint&) = delete;
    TransferEndpoint& operator=(const TransferEndpoint&) = delete;

    // BlobTransfer
    net::awaitable<std::expected<std::string, TransferError>>
    publish(std::filesystem::path path) override;
    net::awaitable<std::expected<std::filesystem::path, TransferError>>
    resolve(std::string ticket) override;
    void stop() override;
    std::string describe() const override;

    const crypto::NodeId& node_id() const { return key_.public_key; }
    uint16_t port() const { return port_; }
    const std::vector<std::string>& addresses() const { return addresses_; }
    const BlobStore& store() const { return store_; }
    std::filesystem::path download_dir() const;
    Stats stats() const;

    // Delay before the next accept after `failures` consecutive errors
    static std::chrono::milliseconds accept_backoff(unsigned failures);

private:
    std::expected<void, TransferError> listen();
    std::vector<std::string> advertised_addresses() const;

    net::awaitable<void> accept_loop();
    net::awaitable<void> serve(tcp::socket socket);

    net::awaitable<std::expected<std::vector<uint8_t>, TransferError>>
    fetch(const std::string& address, const BlobTicket& ticket);

    static std::expected<std::filesystem::path, TransferError>
    write_download(const std::filesystem::path& dir, const crypto::BlobHash& hash,
                   const std::vector<uint8_t>& content);

    net::any_io_executor ex_;
    TransferConfig config_;
    crypto::NodeKey key_;
    BlobStore store_;
    net::thread_pool workers_{2};

    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::vector<std::string> addresses_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> blobs_served_{0};
    std::atomic<uint64_t> bytes_served_{0};
    std::atomic<uint64_t> blobs_fetched_{0};
    std::atomic<uint64_t> bytes_fetched_{0};
};

} // namespace peerdrop
