#include <gtest/gtest.h>
#include "client/transfer_endpoint.hpp"
#include "common/binary_codec.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <fstream>
#include <iterator>

using namespace peerdrop;
namespace fs = std::filesystem;

class TransferEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        auto nonce = crypto::random_nonce();
        ASSERT_TRUE(nonce.has_value());
        root_ = fs::temp_directory_path() / ("peerdrop_transfer_" + wire::hex_encode(std::span(nonce->data(), 6)));
        fs::create_directories(root_);
    }

    void TearDown() override {
        for (auto& endpoint : endpoints_) {
            endpoint->stop();
        }
        ioc_.run_for(std::chrono::milliseconds(200));
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    template<typename T>
    T await(net::awaitable<T> task) {
        std::optional<T> result;
        net::co_spawn(ioc_, std::move(task), [&](std::exception_ptr ep, T value) {
            if (ep) std::rethrow_exception(ep);
            result = std::move(value);
        });
        while (!result) {
            ioc_.run_one();
        }
        return std::move(*result);
    }

    std::shared_ptr<TransferEndpoint> make_endpoint(const std::string& name, uint64_t max_blob_size = 1ull << 20) {
        TransferConfig config;
        config.bind_address = "127.0.0.1";
        config.port = 0;
        config.download_dir = (root_ / name).string();
        config.max_blob_size = max_blob_size;

        auto endpoint = await(TransferEndpoint::initialize(ioc_.get_executor(), config));
        EXPECT_TRUE(endpoint.has_value());
        if (!endpoint) return nullptr;
        endpoints_.push_back(*endpoint);
        return *endpoint;
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto path = root_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    net::io_context ioc_;
    fs::path root_;
    std::vector<std::shared_ptr<TransferEndpoint>> endpoints_;
};

TEST_F(TransferEndpointTest, InitializeBindsAndAdvertises) {
    auto endpoint = make_endpoint("a");
    ASSERT_NE(endpoint, nullptr);
    EXPECT_NE(endpoint->port(), 0);
    ASSERT_EQ(endpoint->addresses().size(), 1u);
    EXPECT_EQ(endpoint->addresses()[0], "127.0.0.1:" + std::to_string(endpoint->port()));
}

TEST_F(TransferEndpointTest, InitializeFailsOnBadBindAddress) {
    TransferConfig config;
    config.bind_address = "not-an-ip";
    auto endpoint = await(TransferEndpoint::initialize(ioc_.get_executor(), config));
    ASSERT_FALSE(endpoint.has_value());
    EXPECT_EQ(endpoint.error().code, TransferErrorCode::BIND_FAILED);
}

TEST_F(TransferEndpointTest, PublishProducesTicket) {
    auto endpoint = make_endpoint("a");
    ASSERT_NE(endpoint, nullptr);
    auto path = write_file("a.txt", "hello peers");

    auto ticket = await(endpoint->publish(path));
    ASSERT_TRUE(ticket.has_value()) << transfer_error_message(ticket.error());

    auto parsed = BlobTicket::parse(*ticket);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->node_id, endpoint->node_id());
    EXPECT_NE(parsed->node_id, crypto::NodeId{});
    EXPECT_NE(parsed->hash, crypto::BlobHash{});
    EXPECT_EQ(parsed->format, BlobFormat::Raw);
    EXPECT_EQ(parsed->addresses, endpoint->addresses());
    EXPECT_EQ(endpoint->store().count(), 1u);
}

TEST_F(TransferEndpointTest, ResolveOnSameEndpointReturnsOriginalBytes) {
    auto endpoint = make_endpoint("a");
    ASSERT_NE(endpoint, nullptr);
    auto path = write_file("a.txt", "the original bytes");

    auto ticket = await(endpoint->publish(path));
    ASSERT_TRUE(ticket.has_value());

    auto resolved = await(endpoint->resolve(*ticket));
    ASSERT_TRUE(resolved.has_value()) << transfer_error_message(resolved.error());
    EXPECT_EQ(read_file(*resolved), "the original bytes");
}

TEST_F(TransferEndpointTest, ResolveAcrossEndpoints) {
    auto sender = make_endpoint("sender");
    auto receiver = make_endpoint("receiver");
    ASSERT_NE(sender, nullptr);
    ASSERT_NE(receiver, nullptr);

    std::string content(100000, '\0');
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>(i * 31);
    }
    auto path = write_file("big.bin", content);

    auto ticket = await(sender->publish(path));
    ASSERT_TRUE(ticket.has_value());

    auto resolved = await(receiver->resolve(*ticket));
    ASSERT_TRUE(resolved.has_value()) << transfer_error_message(resolved.error());
    EXPECT_EQ(read_file(*resolved), content);
    EXPECT_EQ(resolved->parent_path(), receiver->download_dir());

    EXPECT_EQ(sender->stats().blobs_served, 1u);
    EXPECT_EQ(receiver->stats().blobs_fetched, 1u);
    EXPECT_EQ(receiver->stats().bytes_fetched, content.size());
    // Received content lives on disk only
    EXPECT_FALSE(receiver->store().contains(BlobTicket::parse(*ticket)->hash));
    EXPECT_EQ(receiver->store().count(), 0u);
    EXPECT_EQ(receiver->store().total_bytes(), 0u);

    auto again = await(receiver->resolve(*ticket));
    ASSERT_TRUE(again.has_value()) << transfer_error_message(again.error());
    EXPECT_EQ(read_file(*again), content);
    EXPECT_EQ(receiver->stats().blobs_fetched, 2u);
    EXPECT_EQ(receiver->store().count(), 0u);
}

TEST_F(TransferEndpointTest, PublishDoesNotBlockEventLoop) {
    auto endpoint = make_endpoint("a", 64ull << 20);
    ASSERT_NE(endpoint, nullptr);
    auto path = write_file("large.bin", std::string(16u << 20, 'x'));

    bool published = false;
    net::co_spawn(ioc_, endpoint->publish(path),
        [&](std::exception_ptr ep, std::expected<std::string, TransferError> ticket) {
            if (ep) std::rethrow_exception(ep);
            EXPECT_TRUE(ticket.has_value());
            published = true;
        });

    // Other handlers keep running while the file is read and hashed
    size_t ticks = 0;
    bool ticker_done = false;
    net::co_spawn(ioc_, [&]() -> net::awaitable<void> {
        while (!published) {
            ++ticks;
            co_await net::post(ioc_, net::use_awaitable);
        }
        ticker_done = true;
    }, net::detached);

    while (!published || !ticker_done) {
        ioc_.run_one();
    }
    EXPECT_GT(ticks, 10u);
    EXPECT_EQ(endpoint->store().count(), 1u);
}

TEST_F(TransferEndpointTest, AcceptBackoffGrowsAndCaps) {
    using std::chrono::milliseconds;
    EXPECT_EQ(TransferEndpoint::accept_backoff(0), milliseconds(0));
    EXPECT_EQ(TransferEndpoint::accept_backoff(1), milliseconds(50));
    EXPECT_EQ(TransferEndpoint::accept_backoff(2), milliseconds(100));
    EXPECT_EQ(TransferEndpoint::accept_backoff(3), milliseconds(200));
    EXPECT_EQ(TransferEndpoint::accept_backoff(7), milliseconds(2000));
    EXPECT_EQ(TransferEndpoint::accept_backoff(1000), milliseconds(2000));
}

TEST_F(TransferEndpointTest, EmptyFileTransfers) {
    auto sender = make_endpoint("sender");
    auto receiver = make_endpoint("receiver");
    ASSERT_NE(sender, nullptr);
    ASSERT_NE(receiver, nullptr);

    auto ticket = await(sender->publish(write_file("empty", "")));
    ASSERT_TRUE(ticket.has_value());
    auto resolved = await(receiver->resolve(*ticket));
    ASSERT_TRUE(resolved.has_value()) << transfer_error_message(resolved.error());
    EXPECT_EQ(read_file(*resolved), "");
}

TEST_F(TransferEndpointTest, PublishUnreadableFileFails) {
    auto endpoint = make_endpoint("a");
    ASSERT_NE(endpoint, nullptr);

    auto ticket = await(endpoint->publish(root_ / "does-not-exist"));
    ASSERT_FALSE(ticket.has_value());
    EXPECT_EQ(ticket.error().code, TransferErrorCode::FILE_UNREADABLE);
}

TEST_F(TransferEndpointTest, PublishRespectsMaxBlobSize) {
    auto endpoint = make_endpoint("a", 4);
    ASSERT_NE(endpoint, nullptr);

    auto ticket = await(endpoint->publish(write_file("five", "12345")));
    ASSERT_FALSE(ticket.has_value());
    EXPECT_EQ(ticket.error().code, TransferErrorCode::FILE_TOO_LARGE);
}

TEST_F(TransferEndpointTest, MalformedTicketFails) {
    auto endpoint = make_endpoint("a");
    ASSERT_NE(endpoint, nullptr);

    auto resolved = await(endpoint->resolve("not a ticket"));
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, TransferErrorCode::INVALID_TICKET);
}

TEST_F(TransferEndpointTest, WrongNodeIdFailsVerification) {
    auto sender = make_endpoint("sender");
    auto receiver = make_endpoint("receiver");
    ASSERT_NE(sender, nullptr);
    ASSERT_NE(receiver, nullptr);

    auto ticket = await(sender->publish(write_file("a.txt", "signed content")));
    ASSERT_TRUE(ticket.has_value());

    auto tampered = BlobTicket::parse(*ticket);
    ASSERT_TRUE(tampered.has_value());
    tampered->node_id = receiver->node_id();

    auto resolved = await(receiver->resolve(tampered->serialize()));
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, TransferErrorCode::VERIFICATION_FAILED);
}

TEST_F(TransferEndpointTest, UnknownHashIsNotFound) {
    auto sender = make_endpoint("sender");
    auto receiver = make_endpoint("receiver");
    ASSERT_NE(sender, nullptr);
    ASSERT_NE(receiver, nullptr);

    auto ticket = await(sender->publish(write_file("a.txt", "content")));
    ASSERT_TRUE(ticket.has_value());

    auto tampered = BlobTicket::parse(*ticket);
    ASSERT_TRUE(tampered.has_value());
    tampered->hash[0] ^= 0xFF;

    auto resolved = await(receiver->resolve(tampered->serialize()));
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, TransferErrorCode::NOT_FOUND);
}

TEST_F(TransferEndpointTest, UnreachablePeer) {
    auto sender = make_endpoint("sender");
    auto receiver = make_endpoint("receiver");
    ASSERT_NE(sender, nullptr);
    ASSERT_NE(receiver, nullptr);

    auto ticket = await(sender->publish(write_file("a.txt", "content")));
    ASSERT_TRUE(ticket.has_value());
    uint16_t port = sender->port();
    sender->stop();
    // Let the accept loop observe the close
    ioc_.poll();

    auto parsed = BlobTicket::parse(*ticket);
    ASSERT_TRUE(parsed.has_value());
    parsed->addresses = {"127.0.0.1:" + std::to_string(port)};

    auto resolved = await(receiver->resolve(parsed->serialize()));
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, TransferErrorCode::PEER_UNREACHABLE);
}
