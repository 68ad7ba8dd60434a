#include "client/task_registry.hpp"
#include "common/log.hpp"
#include <boost/asio/co_spawn.hpp>

namespace peerdrop {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::SESSION_LOGGER);
    return instance;
}
} // anonymous namespace

const char* task_state_name(TaskState state) {
    switch (state) {
        case TaskState::RUNNING: return "RUNNING";
        case TaskState::FINISHED: return "FINISHED";
        case TaskState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

TaskRegistry::TaskRegistry(net::any_io_executor ex)
    : ex_(std::move(ex))
    , table_(std::make_shared<Table>())
{}

uint64_t TaskRegistry::spawn(std::string name, net::awaitable<void> task, ExitHandler on_exit) {
    uint64_t id = 0;
    {
        std::lock_guard lock(table_->mutex);
        id = table_->next_id++;
        table_->tasks[id] = TaskInfo{id, name, TaskState::RUNNING, {}};
    }

    logger().debug("Task {} '{}' spawned", id, name);

    net::co_spawn(
        ex_,
        std::move(task),
        [table = table_, id, on_exit = std::move(on_exit)](std::exception_ptr ep) {
            TaskInfo info;
            {
                std::lock_guard lock(table->mutex);
                auto& entry = table->tasks[id];
                if (ep) {
                    entry.state = TaskState::FAILED;
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        entry.exit_reason = e.what();
                    }
                } else {
                    entry.state = TaskState::FINISHED;
                    entry.exit_reason = "completed";
                }
                info = entry;

                table->exited.push_back(id);
                while (table->exited.size() > HISTORY_LIMIT) {
                    table->tasks.erase(table->exited.front());
                    table->exited.pop_front();
                }
            }

            if (info.state == TaskState::FAILED) {
                logger().warn("Task {} '{}' failed: {}", info.id, info.name, info.exit_reason);
            } else {
                logger().debug("Task {} '{}' finished", info.id, info.name);
            }

            if (on_exit) {
                on_exit(info);
            }
        });

    return id;
}

std::optional<TaskInfo> TaskRegistry::find(uint64_t id) const {
    std::lock_guard lock(table_->mutex);
    auto it = table_->tasks.find(id);
    if (it == table_->tasks.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TaskInfo> TaskRegistry::snapshot() const {
    std::lock_guard lock(table_->mutex);
    std::vector<TaskInfo> result;
    result.reserve(table_->tasks.size());
    for (const auto& [id, info] : table_->tasks) {
        result.push_back(info);
    }
    return result;
}

size_t TaskRegistry::running() const {
    std::lock_guard lock(table_->mutex);
    size_t count = 0;
    for (const auto& [id, info] : table_->tasks) {
        if (info.state == TaskState::RUNNING) ++count;
    }
    return count;
}

} // namespace peerdrop
