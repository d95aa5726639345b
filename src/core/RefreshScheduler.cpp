#include "core/RefreshScheduler.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include "logging/Log.h"

namespace net = boost::asio;

namespace lmv::core {

struct TaskHandle::State {
    explicit State(net::io_context& ioc) : strand(net::make_strand(ioc)), timer(strand) {}

    net::strand<net::io_context::executor_type> strand;
    net::steady_timer timer;
    RefreshScheduler::AdaptiveTask task;
    std::atomic<bool> cancelled{false};
    // Bumped on every arm so that superseded waits are ignored.
    std::uint64_t generation{0};
};

void TaskHandle::cancel() {
    if (!state_) {
        return;
    }
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    auto state = state_;
    net::post(state->strand, [state]() {
        ++state->generation;
        state->timer.cancel();
        state->task = nullptr;
    });
}

void TaskHandle::reschedule(std::chrono::milliseconds delay) {
    if (!active()) {
        return;
    }
    auto state = state_;
    net::post(state->strand, [state, delay]() {
        if (state->cancelled.load(std::memory_order_acquire)) {
            return;
        }
        RefreshScheduler::arm_(state, delay);
    });
}

bool TaskHandle::active() const noexcept {
    return state_ && !state_->cancelled.load(std::memory_order_acquire);
}

RefreshScheduler::RefreshScheduler(std::size_t threads) : work_(ioc_.get_executor()) {
    const std::size_t count = std::max<std::size_t>(threads, 1);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() {
            for (;;) {
                try {
                    ioc_.run();
                    break;
                }
                catch (const std::exception& ex) {
                    LOG_ERROR(logging::LogCategory::NET, "Scheduler task threw: %s", ex.what());
                }
            }
        });
    }
}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

TaskHandle RefreshScheduler::schedule(Duration initialDelay, AdaptiveTask task) {
    auto state = std::make_shared<TaskHandle::State>(ioc_);
    state->task = std::move(task);
    if (!running() || !state->task) {
        state->cancelled.store(true, std::memory_order_release);
        return TaskHandle(state);
    }
    net::post(state->strand, [state, initialDelay]() {
        if (!state->cancelled.load(std::memory_order_acquire)) {
            arm_(state, initialDelay);
        }
    });
    return TaskHandle(state);
}

TaskHandle RefreshScheduler::scheduleEvery(Duration interval, std::function<void()> task) {
    const Duration period = std::max(interval, Duration{1});
    return schedule(Duration{0}, [period, task = std::move(task)]() -> std::optional<Duration> {
        task();
        return period;
    });
}

void RefreshScheduler::post(std::function<void()> fn) {
    if (!running() || !fn) {
        return;
    }
    net::post(ioc_, std::move(fn));
}

void RefreshScheduler::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    work_.reset();
    ioc_.stop();
    const auto self = std::this_thread::get_id();
    for (auto& thread : threads_) {
        if (!thread.joinable()) {
            continue;
        }
        if (thread.get_id() == self) {
            thread.detach();
        }
        else {
            thread.join();
        }
    }
    threads_.clear();
}

void RefreshScheduler::arm_(const std::shared_ptr<TaskHandle::State>& state, Duration delay) {
    const auto generation = ++state->generation;
    state->timer.expires_after(delay);
    state->timer.async_wait([state, generation](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted || generation != state->generation) {
            return;
        }
        if (state->cancelled.load(std::memory_order_acquire) || !state->task) {
            return;
        }

        std::optional<Duration> next;
        try {
            next = state->task();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::NET, "Periodic task failed: %s", ex.what());
            next = Duration{1000};
        }

        if (!next) {
            state->cancelled.store(true, std::memory_order_release);
            state->task = nullptr;
            return;
        }
        if (generation != state->generation || state->cancelled.load(std::memory_order_acquire)) {
            return;
        }
        arm_(state, *next);
    });
}

}  // namespace lmv::core
