#include "chatvault/sessions/checkpoint.hpp"

#include <stdexcept>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatvault/core/logger.hpp"

namespace chatvault::sessions {

using boost::asio::use_awaitable;

CheckpointTimer::CheckpointTimer(std::chrono::milliseconds interval, Task task)
    : interval_(interval), task_(std::move(task)) {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Checkpoint interval must be positive");
    }
    if (!task_) {
        throw std::invalid_argument("Checkpoint task must not be null");
    }
}

CheckpointTimer::~CheckpointTimer() {
    stop();
    if (worker_.joinable()) {
        // Only reachable when the timer is destroyed from its own task.
        if (std::this_thread::get_id() == worker_.get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void CheckpointTimer::start() {
    std::lock_guard lock(mutex_);
    if (running_.load(std::memory_order_acquire)) return;

    if (worker_.joinable()) {
        // A previous loop was stopped from inside its own tick.
        if (std::this_thread::get_id() == worker_.get_id()) {
            LOG_WARN("Checkpoint timer cannot be restarted from its own tick");
            return;
        }
        worker_.join();
    }

    ioc_.restart();
    running_.store(true, std::memory_order_release);
    boost::asio::co_spawn(ioc_, run(), boost::asio::detached);
    worker_ = std::thread([this] { ioc_.run(); });

    LOG_DEBUG("Checkpoint timer started ({}ms interval)", interval_.count());
}

void CheckpointTimer::stop() {
    std::thread worker;
    {
        std::lock_guard lock(mutex_);
        running_.store(false, std::memory_order_release);
        if (!worker_.joinable()) return;

        // From inside a tick: the loop sees running_ == false and exits
        // once the task returns.
        if (std::this_thread::get_id() == worker_.get_id()) return;

        boost::asio::post(ioc_, [this] { timer_.cancel(); });
        worker = std::move(worker_);
    }
    worker.join();
    LOG_DEBUG("Checkpoint timer stopped after {} ticks", ticks());
}

auto CheckpointTimer::run() -> awaitable<void> {
    while (running_.load(std::memory_order_acquire)) {
        timer_.expires_after(interval_);
        auto [ec] = co_await timer_.async_wait(boost::asio::as_tuple(use_awaitable));

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                break;
            }
            LOG_WARN("Checkpoint timer error: {}", ec.message());
            continue;
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        try {
            task_();
        } catch (const std::exception& e) {
            LOG_WARN("Checkpoint failed, retrying next tick: {}", e.what());
        }
        ticks_.fetch_add(1, std::memory_order_acq_rel);
    }
}

} // namespace chatvault::sessions
