#include "client/transfer_endpoint.hpp"
#include "common/binary_codec.hpp"
#include "common/log.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace peerdrop {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::TRANSFER_LOGGER);
    return instance;
}

// "host:port" or "[v6]:port"
bool split_address(const std::string& address, std::string& host, std::string& port) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        return false;
    }
    host = address.substr(0, colon);
    port = address.substr(colon + 1);
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return true;
}

std::vector<uint8_t> signed_payload(const crypto::Nonce& nonce, const crypto::BlobHash& hash) {
    std::vector<uint8_t> payload;
    payload.reserve(nonce.size() + hash.size());
    payload.insert(payload.end(), nonce.begin(), nonce.end());
    payload.insert(payload.end(), hash.begin(), hash.end());
    return payload;
}
} // anonymous namespace

std::string transfer_error_message(const TransferError& error) {
    std::string prefix;
    switch (error.code) {
        case TransferErrorCode::KEY_SETUP_FAILED: prefix = "Failed to create node key"; break;
        case TransferErrorCode::BIND_FAILED: prefix = "Failed to bind transfer listener"; break;
        case TransferErrorCode::FILE_UNREADABLE: prefix = "Cannot read file"; break;
        case TransferErrorCode::FILE_TOO_LARGE: prefix = "File exceeds maximum blob size"; break;
        case TransferErrorCode::HASH_FAILED: prefix = "Failed to hash content"; break;
        case TransferErrorCode::INVALID_TICKET: prefix = "Invalid ticket"; break;
        case TransferErrorCode::PEER_UNREACHABLE: prefix = "Peer unreachable"; break;
        case TransferErrorCode::NOT_FOUND: prefix = "Peer does not have the blob"; break;
        case TransferErrorCode::BAD_RESPONSE: prefix = "Malformed response from peer"; break;
        case TransferErrorCode::VERIFICATION_FAILED: prefix = "Blob verification failed"; break;
        case TransferErrorCode::WRITE_FAILED: prefix = "Failed to write downloaded file"; break;
        default: prefix = "Transfer error"; break;
    }
    return error.detail.empty() ? prefix : prefix + ": " + error.detail;
}

// ============================================================================
// Setup
// ============================================================================

net::awaitable<std::expected<std::shared_ptr<TransferEndpoint>, TransferError>>
TransferEndpoint::initialize(net::any_io_executor ex, const TransferConfig& config) {
    auto key = crypto::generate_node_key();
    if (!key) {
        co_return std::unexpected(TransferError{
            TransferErrorCode::KEY_SETUP_FAILED, crypto::crypto_error_message(key.error())});
    }

    auto endpoint = std::make_shared<TransferEndpoint>(Private{}, ex, config, *key);
    if (auto result = endpoint->listen(); !result) {
        co_return std::unexpected(result.error());
    }

    endpoint->running_.store(true, std::memory_order_release);
    net::co_spawn(
        ex,
        [endpoint]() -> net::awaitable<void> {
            co_await endpoint->accept_loop();
        },
        [](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    logger().error("Accept loop exception: {}", e.what());
                }
            }
        });

    logger().info("Transfer endpoint {} listening on port {}",
                  crypto::short_id(endpoint->node_id()), endpoint->port_);
    co_return endpoint;
}

TransferEndpoint::TransferEndpoint(Private, net::any_io_executor ex, TransferConfig config,
                                   crypto::NodeKey key)
    : ex_(ex)
    , config_(std::move(config))
    , key_(key)
    , acceptor_(ex)
{}

TransferEndpoint::~TransferEndpoint() = default;

std::expected<void, TransferError> TransferEndpoint::listen() {
    boost::system::error_code ec;
    auto address = net::ip::make_address(config_.bind_address, ec);
    if (ec) {
        return std::unexpected(TransferError{TransferErrorCode::BIND_FAILED,
                                             "invalid bind address '" + config_.bind_address + "'"});
    }

    tcp::endpoint endpoint{address, config_.port};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return std::unexpected(TransferError{TransferErrorCode::BIND_FAILED, ec.message()});
    }

    port_ = acceptor_.local_endpoint(ec).port();
    if (ec) {
        return std::unexpected(TransferError{TransferErrorCode::BIND_FAILED, ec.message()});
    }

    addresses_ = advertised_addresses();
    return {};
}

std::vector<std::string> TransferEndpoint::advertised_addresses() const {
    if (!config_.advertise_addresses.empty()) {
        return config_.advertise_addresses;
    }

    std::vector<std::string> result;
    auto port = std::to_string(port_);

    boost::system::error_code ec;
    auto bound = net::ip::make_address(config_.bind_address, ec);
    if (!ec && !bound.is_unspecified()) {
        result.push_back(bound.is_v6() ? "[" + bound.to_string() + "]:" + port
                                       : bound.to_string() + ":" + port);
        return result;
    }

    result.push_back("127.0.0.1:" + port);

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        logger().warn("getifaddrs failed: {}", strerror(errno));
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;

        // Skip loopback (already listed) and interfaces that are down
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (!(ifa->ifa_flags & IFF_RUNNING)) continue;

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr->sin_addr, ip_str, sizeof(ip_str));

        std::string ip = ip_str;
        if (ip.starts_with("169.254")) continue;

        logger().debug("Found local address {} on {}", ip, ifa->ifa_name);
        result.push_back(ip + ":" + port);
    }

    freeifaddrs(ifaddr);
    return result;
}

void TransferEndpoint::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    boost::system::error_code ec;
    acceptor_.close(ec);
    logger().info("Transfer endpoint {} stopped", crypto::short_id(node_id()));
}

std::string TransferEndpoint::describe() const {
    std::string text = crypto::short_id(node_id()) + " @";
    for (const auto& addr : addresses_) {
        text += " " + addr;
    }
    return text;
}

std::filesystem::path TransferEndpoint::download_dir() const {
    if (!config_.download_dir.empty()) {
        return config_.download_dir;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return (ec ? std::filesystem::path(".") : tmp) / "peerdrop";
}

TransferEndpoint::Stats TransferEndpoint::stats() const {
    Stats s;
    s.blobs_served = blobs_served_.load(std::memory_order_relaxed);
    s.bytes_served = bytes_served_.load(std::memory_order_relaxed);
    s.blobs_fetched = blobs_fetched_.load(std::memory_order_relaxed);
    s.bytes_fetched = bytes_fetched_.load(std::memory_order_relaxed);
    return s;
}

// ============================================================================
// Publish / Resolve
// ============================================================================

net::awaitable<std::expected<std::string, TransferError>>
TransferEndpoint::publish(std::filesystem::path path) {
    auto self = shared_from_this();

    struct Loaded {
        crypto::BlobHash hash;
        std::vector<uint8_t> content;
    };

    // Read and hash on a worker; resumes on this coroutine's executor
    auto loaded = co_await net::co_spawn(
        workers_,
        [path, max_size = config_.max_blob_size]() -> net::awaitable<std::expected<Loaded, TransferError>> {
            std::error_code fs_ec;
            auto size = std::filesystem::file_size(path, fs_ec);
            if (fs_ec) {
                co_return std::unexpected(TransferError{
                    TransferErrorCode::FILE_UNREADABLE, path.string() + ": " + fs_ec.message()});
            }
            if (size > max_size) {
                co_return std::unexpected(TransferError{
                    TransferErrorCode::FILE_TOO_LARGE, path.string() + " is " + std::to_string(size) + " bytes"});
            }

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                co_return std::unexpected(TransferError{TransferErrorCode::FILE_UNREADABLE, path.string()});
            }
            std::vector<uint8_t> content(size);
            if (size > 0 && !file.read(reinterpret_cast<char*>(content.data()), static_cast<std::streamsize>(size))) {
                co_return std::unexpected(TransferError{TransferErrorCode::FILE_UNREADABLE, path.string()});
            }

            auto hash = crypto::blob_hash(content);
            if (!hash) {
                co_return std::unexpected(TransferError{
                    TransferErrorCode::HASH_FAILED, crypto::crypto_error_message(hash.error())});
            }
            co_return Loaded{*hash, std::move(content)};
        },
        net::use_awaitable);

    if (!loaded) {
        co_return std::unexpected(loaded.error());
    }

    auto size = loaded->content.size();
    store_.insert(loaded->hash, std::move(loaded->content));

    BlobTicket ticket;
    ticket.node_id = node_id();
    ticket.addresses = addresses_;
    ticket.hash = loaded->hash;
    ticket.format = BlobFormat::Raw;

    logger().info("Published {} ({} bytes) as {}", path.string(), size, wire::hex_encode(loaded->hash));
    co_return ticket.serialize();
}

net::awaitable<std::expected<std::filesystem::path, TransferError>>
TransferEndpoint::resolve(std::string ticket_text) {
    auto self = shared_from_this();

    auto ticket = BlobTicket::parse(ticket_text);
    if (!ticket) {
        co_return std::unexpected(TransferError{
            TransferErrorCode::INVALID_TICKET, ticket_error_message(ticket.error())});
    }

    auto dir = download_dir();

    // Our own blob: only the file write is needed
    if (auto local = store_.get(ticket->hash)) {
        logger().debug("Blob {} already present locally", wire::hex_encode(ticket->hash));
        co_return co_await net::co_spawn(
            workers_,
            [dir, hash = ticket->hash, local]() -> net::awaitable<std::expected<std::filesystem::path, TransferError>> {
                co_return write_download(dir, hash, *local);
            },
            net::use_awaitable);
    }

    if (ticket->addresses.empty()) {
        co_return std::unexpected(TransferError{
            TransferErrorCode::PEER_UNREACHABLE, "ticket carries no addresses"});
    }

    TransferError last_error;
    for (const auto& address : ticket->addresses) {
        auto content = co_await fetch(address, *ticket);
        if (!content) {
            logger().debug("Fetch from {} failed: {}", address, transfer_error_message(content.error()));
            last_error = content.error();
            // Every address belongs to the same node; only a connection failure is worth retrying elsewhere
            if (last_error.code != TransferErrorCode::PEER_UNREACHABLE) {
                break;
            }
            continue;
        }

        auto size = content->size();
        auto written = co_await net::co_spawn(
            workers_,
            [dir, hash = ticket->hash, content = std::move(*content)]()
                -> net::awaitable<std::expected<std::filesystem::path, TransferError>> {
                auto actual = crypto::blob_hash(content);
                if (!actual) {
                    co_return std::unexpected(TransferError{
                        TransferErrorCode::HASH_FAILED, crypto::crypto_error_message(actual.error())});
                }
                if (*actual != hash) {
                    co_return std::unexpected(TransferError{
                        TransferErrorCode::VERIFICATION_FAILED, "content hash does not match ticket"});
                }
                co_return write_download(dir, hash, content);
            },
            net::use_awaitable);

        if (written) {
            blobs_fetched_.fetch_add(1, std::memory_order_relaxed);
            bytes_fetched_.fetch_add(size, std::memory_order_relaxed);
        }
        co_return written;
    }

    co_return std::unexpected(last_error);
}

std::expected<std::filesystem::path, TransferError>
TransferEndpoint::write_download(const std::filesystem::path& dir, const crypto::BlobHash& hash,
                                 const std::vector<uint8_t>& content) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(TransferError{TransferErrorCode::WRITE_FAILED, dir.string() + ": " + ec.message()});
    }

    auto path = dir / wire::hex_encode(hash);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(TransferError{TransferErrorCode::WRITE_FAILED, path.string()});
    }
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected(TransferError{TransferErrorCode::WRITE_FAILED, path.string()});
    }

    logger().info("Wrote {} bytes to {}", content.size(), path.string());
    return path;
}

// ============================================================================
// Client side of the blob protocol
// ============================================================================

net::awaitable<std::expected<std::vector<uint8_t>, TransferError>>
TransferEndpoint::fetch(const std::string& address, const BlobTicket& ticket) {
    std::string host, port;
    if (!split_address(address, host, port)) {
        co_return std::unexpected(TransferError{TransferErrorCode::PEER_UNREACHABLE, "bad address " + address});
    }

    boost::system::error_code ec;
    tcp::resolver resolver(ex_);
    auto endpoints = co_await resolver.async_resolve(host, port, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(TransferError{TransferErrorCode::PEER_UNREACHABLE, address + ": " + ec.message()});
    }

    tcp::socket socket(ex_);
    co_await net::async_connect(socket, endpoints, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(TransferError{TransferErrorCode::PEER_UNREACHABLE, address + ": " + ec.message()});
    }

    auto nonce = crypto::random_nonce();
    if (!nonce) {
        co_return std::unexpected(TransferError{
            TransferErrorCode::VERIFICATION_FAILED, crypto::crypto_error_message(nonce.error())});
    }

    wire::BinaryWriter request(blob_protocol::REQUEST_SIZE);
    request.write_fixed_bytes(blob_protocol::MAGIC);
    request.write_u8(blob_protocol::VERSION);
    request.write_fixed_bytes(ticket.hash);
    request.write_fixed_bytes(*nonce);

    co_await net::async_write(socket, net::buffer(request.data()), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(TransferError{TransferErrorCode::PEER_UNREACHABLE, address + ": " + ec.message()});
    }

    uint8_t status = 0;
    co_await net::async_read(socket, net::buffer(&status, 1), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(TransferError{TransferErrorCode::BAD_RESPONSE, ec.message()});
    }

    switch (static_cast<blob_protocol::Status>(status)) {
        case blob_protocol::Status::OK:
            break;
        case blob_protocol::Status::NOT_FOUND:
            co_return std::unexpected(TransferError{TransferErrorCode::NOT_FOUND, wire::hex_encode(ticket.hash)});
        case blob_protocol::Status::BAD_REQUEST:
            co_return std::unexpected(TransferError{TransferErrorCode::BAD_RESPONSE, "peer rejected request"});
        default:
            co_return std::unexpected(TransferError{
                TransferErrorCode::BAD_RESPONSE, "unknown status " + std::to_string(status)});
    }

    std::array<uint8_t, crypto::SIGNATURE_SIZE + 8> header{};
    co_await net::async_read(socket, net::buffer(header), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(TransferError{TransferErrorCode::BAD_RESPONSE, ec.message()});
    }

    wire::BinaryReader reader(header);
    auto signature = reader.read_fixed_array<crypto::SIGNATURE_SIZE>();
    auto length = reader.read_u64();
    if (!signature || !length) {
        co_return std::unexpected(TransferError{TransferErrorCode::BAD_RESPONSE, "truncated header"});
    }

    if (!crypto::verify(signed_payload(*nonce, ticket.hash), *signature, ticket.node_id)) {
        co_return std::unexpected(TransferError{
            TransferErrorCode::VERIFICATION_FAILED, "peer is not " + crypto::short_id(ticket.node_id)});
    }

    if (*length > config_.max_blob_size) {
        co_return std::unexpected(TransferError{
            TransferErrorCode::BAD_RESPONSE, "blob of " + std::to_string(*length) + " bytes exceeds limit"});
    }

    std::vector<uint8_t> content(static_cast<size_t>(*length));
    if (!content.empty()) {
        co_await net::async_read(socket, net::buffer(content), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(TransferError{TransferErrorCode::BAD_RESPONSE, ec.message()});
        }
    }

    co_return content;
}

// ============================================================================
// Server side of the blob protocol
// ============================================================================

std::chrono::milliseconds TransferEndpoint::accept_backoff(unsigned failures) {
    constexpr std::chrono::milliseconds base{50};
    constexpr std::chrono::milliseconds limit{2000};
    if (failures == 0) {
        return std::chrono::milliseconds{0};
    }
    std::chrono::milliseconds delay = base * (1 << std::min(failures - 1, 6u));
    return std::min(delay, limit);
}

net::awaitable<void> TransferEndpoint::accept_loop() {
    unsigned failures = 0;
    net::steady_timer backoff(ex_);

    while (running_.load(std::memory_order_acquire)) {
        boost::system::error_code ec;
        tcp::socket socket(ex_);
        co_await acceptor_.async_accept(socket, net::redirect_error(net::use_awaitable, ec));

        if (ec) {
            if (ec == net::error::operation_aborted || !running_.load(std::memory_order_acquire)) {
                break;
            }
            auto delay = accept_backoff(++failures);
            logger().warn("Accept failed: {}, retrying in {} ms", ec.message(), delay.count());
            backoff.expires_after(delay);
            co_await backoff.async_wait(net::redirect_error(net::use_awaitable, ec));
            continue;
        }
        failures = 0;

        net::co_spawn(
            ex_,
            [self = shared_from_this(), socket = std::move(socket)]() mutable -> net::awaitable<void> {
                co_await self->serve(std::move(socket));
            },
            [](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        logger().warn("Blob request handler exception: {}", e.what());
                    }
                }
            });
    }

    logger().debug("Accept loop exited");
}

net::awaitable<void> TransferEndpoint::serve(tcp::socket socket) {
    boost::system::error_code ec;
    std::array<uint8_t, blob_protocol::REQUEST_SIZE> request{};
    co_await net::async_read(socket, net::buffer(request), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        logger().debug("Incomplete blob request: {}", ec.message());
        co_return;
    }

    wire::BinaryReader reader(request);
    auto magic = reader.read_fixed_array<blob_protocol::MAGIC.size()>();
    auto version = reader.read_u8();
    auto hash = reader.read_fixed_array<crypto::BLOB_HASH_SIZE>();
    auto nonce = reader.read_fixed_array<crypto::NONCE_SIZE>();

    auto reply_status = [&](blob_protocol::Status status) -> net::awaitable<void> {
        uint8_t byte = static_cast<uint8_t>(status);
        boost::system::error_code write_ec;
        co_await net::async_write(socket, net::buffer(&byte, 1), net::redirect_error(net::use_awaitable, write_ec));
        if (write_ec) {
            logger().debug("Failed to send status {}: {}", byte, write_ec.message());
        }
    };

    if (!magic || *magic != blob_protocol::MAGIC || !version || *version != blob_protocol::VERSION ||
        !hash || !nonce) {
        logger().warn("Rejecting malformed blob request");
        co_await reply_status(blob_protocol::Status::BAD_REQUEST);
        co_return;
    }

    auto blob = store_.get(*hash);
    if (!blob) {
        logger().debug("Blob {} not found", wire::hex_encode(*hash));
        co_await reply_status(blob_protocol::Status::NOT_FOUND);
        co_return;
    }

    auto signature = crypto::sign(signed_payload(*nonce, *hash), key_.secret_key);
    if (!signature) {
        logger().error("Failed to sign blob response: {}", crypto::crypto_error_message(signature.error()));
        co_await reply_status(blob_protocol::Status::BAD_REQUEST);
        co_return;
    }

    wire::BinaryWriter header(1 + crypto::SIGNATURE_SIZE + 8);
    header.write_u8(static_cast<uint8_t>(blob_protocol::Status::OK));
    header.write_fixed_bytes(*signature);
    header.write_u64(blob->size());

    std::array<net::const_buffer, 2> buffers = {
        net::buffer(header.data()),
        net::buffer(*blob),
    };
    co_await net::async_write(socket, buffers, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        logger().warn("Failed to send blob {}: {}", wire::hex_encode(*hash), ec.message());
        co_return;
    }

    blobs_served_.fetch_add(1, std::memory_order_relaxed);
    bytes_served_.fetch_add(blob->size(), std::memory_order_relaxed);
    logger().info("Served blob {} ({} bytes)", wire::hex_encode(*hash), blob->size());
}

} // namespace peerdrop
