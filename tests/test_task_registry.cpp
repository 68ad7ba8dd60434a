#include <gtest/gtest.h>
#include "client/task_registry.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>

using namespace peerdrop;

namespace {

net::awaitable<void> finish_at_once() {
    co_return;
}

net::awaitable<void> fail_at_once() {
    throw std::runtime_error("boom");
    co_return;
}

net::awaitable<void> wait_forever(std::shared_ptr<net::steady_timer> timer) {
    timer->expires_at(net::steady_timer::time_point::max());
    boost::system::error_code ec;
    co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
}

} // anonymous namespace

class TaskRegistryTest : public ::testing::Test {
protected:
    net::io_context ioc_;
    TaskRegistry registry_{ioc_.get_executor()};
};

TEST_F(TaskRegistryTest, RecordsExitStateAndReason) {
    std::vector<TaskInfo> exits;
    auto ok = registry_.spawn("ok", finish_at_once(), [&](const TaskInfo& info) { exits.push_back(info); });
    auto bad = registry_.spawn("bad", fail_at_once(), [&](const TaskInfo& info) { exits.push_back(info); });

    ASSERT_TRUE(registry_.find(ok).has_value());
    EXPECT_EQ(registry_.find(ok)->state, TaskState::RUNNING);
    EXPECT_EQ(registry_.running(), 2u);

    ioc_.run();

    ASSERT_EQ(exits.size(), 2u);
    EXPECT_EQ(registry_.find(ok)->state, TaskState::FINISHED);
    EXPECT_EQ(registry_.find(ok)->exit_reason, "completed");
    EXPECT_EQ(registry_.find(bad)->state, TaskState::FAILED);
    EXPECT_EQ(registry_.find(bad)->exit_reason, "boom");
    EXPECT_EQ(registry_.running(), 0u);
}

TEST_F(TaskRegistryTest, FinishedTasksAreCapped) {
    auto timer = std::make_shared<net::steady_timer>(ioc_);
    auto persistent = registry_.spawn("reader", wait_forever(timer));

    uint64_t last = 0;
    for (int i = 0; i < 50; ++i) {
        last = registry_.spawn("publish", finish_at_once());
    }
    while (registry_.running() > 1) {
        ioc_.run_one();
    }

    auto tasks = registry_.snapshot();
    EXPECT_EQ(tasks.size(), 1 + TaskRegistry::HISTORY_LIMIT);
    ASSERT_TRUE(registry_.find(persistent).has_value());
    EXPECT_EQ(registry_.find(persistent)->state, TaskState::RUNNING);
    EXPECT_TRUE(registry_.find(last).has_value());
    // The oldest finished ones are gone
    EXPECT_FALSE(registry_.find(persistent + 1).has_value());

    timer->cancel();
    ioc_.run();
    EXPECT_EQ(registry_.snapshot().size(), TaskRegistry::HISTORY_LIMIT);
}
