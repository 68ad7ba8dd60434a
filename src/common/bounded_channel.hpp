#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>

namespace peerdrop {

namespace net = boost::asio;

/// Bounded multi-producer / single-consumer queue.
///
/// Producers may run on any thread and never block: try_send() fails at once
/// when the queue is full or closed. The consumer is a coroutine on the
/// channel's executor (read()) or a polling loop on the same thread
/// (try_receive()).
///
/// Wake-up uses a steady_timer parked at time_point::max(); cancel() acts as
/// an async condition variable notify.
template<typename T>
class BoundedChannel : public std::enable_shared_from_this<BoundedChannel<T>> {
    struct Private {};

public:
    static std::shared_ptr<BoundedChannel> create(size_t capacity, net::any_io_executor ex) {
        return std::make_shared<BoundedChannel>(Private{}, capacity, std::move(ex));
    }

    BoundedChannel(Private, size_t capacity, net::any_io_executor ex)
        : timer_(ex), capacity_(capacity) {
        timer_.expires_at(net::steady_timer::time_point::max());
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // ================================================================
    // Producer side - any thread
    // ================================================================

    /// Returns false when full or closed; the value is dropped.
    bool try_send(T value) {
        if (closed_.load(std::memory_order_acquire)) return false;
        {
            std::lock_guard lock(mutex_);
            if (queue_.size() >= capacity_) return false;
            queue_.push(std::move(value));
        }
        wake();
        return true;
    }

    /// Already queued values can still be read after close.
    void close() {
        closed_.store(true, std::memory_order_release);
        wake();
    }

    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    // ================================================================
    // Consumer side - channel executor only
    // ================================================================

    /// nullopt once the channel is closed and drained
    net::awaitable<std::optional<T>> read() {
        for (;;) {
            if (auto value = try_receive()) {
                co_return value;
            }
            if (closed_.load(std::memory_order_acquire)) {
                co_return std::nullopt;
            }
            timer_.expires_at(net::steady_timer::time_point::max());
            boost::system::error_code ec;
            co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
            // operation_aborted means wake(); loop and check the queue
        }
    }

    std::optional<T> try_receive() {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

private:
    void wake() {
        net::post(timer_.get_executor(), [weak = this->weak_from_this()]() {
            if (auto self = weak.lock()) {
                self->timer_.cancel();
            }
        });
    }

    net::steady_timer timer_;
    size_t capacity_;
    std::atomic<bool> closed_{false};
    mutable std::mutex mutex_;
    std::queue<T> queue_;
};

} // namespace peerdrop
