#include <gtest/gtest.h>
#include "common/bounded_channel.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>

using namespace peerdrop;

class BoundedChannelTest : public ::testing::Test {
protected:
    net::io_context ioc_;
};

TEST_F(BoundedChannelTest, FifoOrder) {
    auto channel = BoundedChannel<int>::create(8, ioc_.get_executor());
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(channel->try_send(i));
    }
    EXPECT_EQ(channel->size(), 5u);

    for (int i = 0; i < 5; ++i) {
        auto value = channel->try_receive();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    EXPECT_FALSE(channel->try_receive().has_value());
}

TEST_F(BoundedChannelTest, FullChannelFailsImmediately) {
    auto channel = BoundedChannel<std::string>::create(2, ioc_.get_executor());
    EXPECT_TRUE(channel->try_send("a"));
    EXPECT_TRUE(channel->try_send("b"));
    EXPECT_FALSE(channel->try_send("c"));
    EXPECT_EQ(channel->size(), 2u);

    // Space frees up once the consumer reads
    ASSERT_TRUE(channel->try_receive().has_value());
    EXPECT_TRUE(channel->try_send("c"));
}

TEST_F(BoundedChannelTest, ClosedChannelRejectsButDrains) {
    auto channel = BoundedChannel<int>::create(4, ioc_.get_executor());
    ASSERT_TRUE(channel->try_send(1));
    channel->close();

    EXPECT_TRUE(channel->is_closed());
    EXPECT_FALSE(channel->try_send(2));

    std::vector<std::optional<int>> received;
    net::co_spawn(ioc_, [&]() -> net::awaitable<void> {
        received.push_back(co_await channel->read());
        received.push_back(co_await channel->read());
    }, net::detached);
    ioc_.run();

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], 1);
    EXPECT_EQ(received[1], std::nullopt);
}

TEST_F(BoundedChannelTest, ReaderWakesOnSend) {
    auto channel = BoundedChannel<int>::create(4, ioc_.get_executor());

    std::vector<int> received;
    net::co_spawn(ioc_, [&]() -> net::awaitable<void> {
        while (auto value = co_await channel->read()) {
            received.push_back(*value);
        }
    }, net::detached);

    ioc_.poll();
    EXPECT_TRUE(received.empty());

    EXPECT_TRUE(channel->try_send(7));
    EXPECT_TRUE(channel->try_send(8));
    ioc_.poll();
    EXPECT_EQ(received, (std::vector<int>{7, 8}));

    channel->close();
    ioc_.run();
    EXPECT_EQ(received.size(), 2u);
}

TEST_F(BoundedChannelTest, ProducersOnOtherThreads) {
    auto channel = BoundedChannel<int>::create(1000, ioc_.get_executor());

    int sum = 0;
    int count = 0;
    net::co_spawn(ioc_, [&]() -> net::awaitable<void> {
        while (auto value = co_await channel->read()) {
            sum += *value;
            if (++count == 400) {
                channel->close();
            }
        }
    }, net::detached);

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&channel]() {
            for (int i = 1; i <= 100; ++i) {
                EXPECT_TRUE(channel->try_send(i));
            }
        });
    }
    for (auto& p : producers) p.join();

    ioc_.run();
    EXPECT_EQ(count, 400);
    EXPECT_EQ(sum, 4 * 5050);
}
