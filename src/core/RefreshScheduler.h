#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace lmv::core {

class RefreshScheduler;

// Cancelable handle to a periodic task. Copies refer to the same task.
class TaskHandle {
public:
    TaskHandle() = default;

    // Stops the task. Safe from any thread, including from inside the task.
    void cancel();
    // Re-arms the timer with a new delay, replacing the pending wait.
    void reschedule(std::chrono::milliseconds delay);
    bool active() const noexcept;

private:
    friend class RefreshScheduler;
    struct State;
    explicit TaskHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/**
 * Owns the timers driving the render tick, plus a pool for posted work.
 * Tasks must not block; blocking I/O belongs on its own threads.
 *
 * Every task runs on its own strand, so one task never overlaps itself while
 * different tasks proceed in parallel on the pool threads.
 */
class RefreshScheduler {
public:
    using Duration = std::chrono::milliseconds;
    // Returns the delay before the next run, or nullopt to finish.
    using AdaptiveTask = std::function<std::optional<Duration>()>;

    explicit RefreshScheduler(std::size_t threads = 2);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    TaskHandle schedule(Duration initialDelay, AdaptiveTask task);
    TaskHandle scheduleEvery(Duration interval, std::function<void()> task);
    void post(std::function<void()> fn);

    // Cancels outstanding timers and joins the pool. Idempotent.
    void stop();
    bool running() const noexcept { return running_.load(std::memory_order_acquire); }

private:
    friend class TaskHandle;
    static void arm_(const std::shared_ptr<TaskHandle::State>& state, Duration delay);

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{true};
};

}  // namespace lmv::core
