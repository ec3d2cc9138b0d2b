#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace chatvault::sessions {

using boost::asio::awaitable;

/// Runs a task periodically on its own worker thread.
///
/// stop() is synchronous: when it returns, no further tick will start and
/// any tick in progress has finished. Calling stop() from inside the task
/// ends the loop after that tick instead of joining. A task that throws is
/// logged and retried on the next tick.
class CheckpointTimer {
public:
    using Task = std::function<void()>;

    CheckpointTimer(std::chrono::milliseconds interval, Task task);
    ~CheckpointTimer();

    CheckpointTimer(const CheckpointTimer&) = delete;
    auto operator=(const CheckpointTimer&) -> CheckpointTimer& = delete;

    /// No-op if already running.
    void start();
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool {
        return running_.load(std::memory_order_acquire);
    }
    [[nodiscard]] auto ticks() const noexcept -> uint64_t {
        return ticks_.load(std::memory_order_acquire);
    }
    [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds { return interval_; }

private:
    auto run() -> awaitable<void>;

    std::chrono::milliseconds interval_;
    Task task_;

    boost::asio::io_context ioc_;
    boost::asio::steady_timer timer_{ioc_};
    std::thread worker_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::mutex mutex_;
};

} // namespace chatvault::sessions
