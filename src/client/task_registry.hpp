#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop {

namespace net = boost::asio;

enum class TaskState {
    RUNNING,
    FINISHED,
    FAILED,
};

const char* task_state_name(TaskState state);

struct TaskInfo {
    uint64_t id = 0;
    std::string name;
    TaskState state = TaskState::RUNNING;
    std::string exit_reason;
};

/**
 * TaskRegistry - supervision of spawned coroutines.
 *
 * Every task is spawned through the registry so its lifetime is visible:
 * the registry records when it finishes or fails and hands the final
 * TaskInfo to the exit handler. Exit handlers run on the task's executor
 * and may outlive the registry's owner, so they must not capture it.
 *
 * Running tasks are always listed; only the last HISTORY_LIMIT finished or
 * failed tasks are kept.
 */
class TaskRegistry {
public:
    using ExitHandler = std::function<void(const TaskInfo&)>;

    static constexpr size_t HISTORY_LIMIT = 16;

    explicit TaskRegistry(net::any_io_executor ex);

    uint64_t spawn(std::string name, net::awaitable<void> task, ExitHandler on_exit = {});

    std::optional<TaskInfo> find(uint64_t id) const;
    std::vector<TaskInfo> snapshot() const;
    size_t running() const;

private:
    struct Table {
        mutable std::mutex mutex;
        std::map<uint64_t, TaskInfo> tasks;
        std::deque<uint64_t> exited;   // oldest first
        uint64_t next_id = 1;
    };

    net::any_io_executor ex_;
    std::shared_ptr<Table> table_;
};

} // namespace peerdrop
