#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "core/RefreshScheduler.h"

using namespace std::chrono_literals;
using lmv::core::RefreshScheduler;
using lmv::core::TaskHandle;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

void periodicAndCancel() {
    RefreshScheduler scheduler(2);
    std::atomic<int> runs{0};
    TaskHandle handle = scheduler.scheduleEvery(10ms, [&runs]() { ++runs; });
    expect(handle.active(), "fresh handle is active");
    expect(waitFor([&]() { return runs.load() >= 3; }), "periodic task repeats");

    handle.cancel();
    expect(!handle.active(), "cancelled handle is inactive");
    std::this_thread::sleep_for(50ms);
    const int settled = runs.load();
    std::this_thread::sleep_for(100ms);
    expect(runs.load() == settled, "no runs after cancel");
    handle.cancel();
}

void adaptiveFinish() {
    RefreshScheduler scheduler(1);
    std::atomic<int> runs{0};
    TaskHandle handle = scheduler.schedule(0ms, [&runs]() -> std::optional<RefreshScheduler::Duration> {
        if (++runs >= 3) {
            return std::nullopt;
        }
        return 5ms;
    });
    expect(waitFor([&]() { return !handle.active(); }), "task finishes by returning nullopt");
    std::this_thread::sleep_for(50ms);
    expect(runs.load() == 3, "finished task stops running");
}

void noSelfOverlap() {
    RefreshScheduler scheduler(4);
    std::atomic<int> inFlight{0};
    std::atomic<bool> overlapped{false};
    std::atomic<int> runs{0};
    TaskHandle handle = scheduler.scheduleEvery(1ms, [&]() {
        if (++inFlight > 1) {
            overlapped = true;
        }
        std::this_thread::sleep_for(5ms);
        --inFlight;
        ++runs;
    });
    handle.reschedule(1ms);
    handle.reschedule(1ms);
    expect(waitFor([&]() { return runs.load() >= 10; }), "slow task keeps running");
    handle.cancel();
    expect(!overlapped.load(), "task never overlaps itself");
}

void throwingTaskRetries() {
    RefreshScheduler scheduler(1);
    std::atomic<int> runs{0};
    TaskHandle handle = scheduler.schedule(0ms, [&runs]() -> std::optional<RefreshScheduler::Duration> {
        if (++runs == 1) {
            throw std::runtime_error("boom");
        }
        return std::nullopt;
    });
    expect(waitFor([&]() { return runs.load() >= 2; }), "task retried after throwing");
    handle.cancel();
}

void postAndStop() {
    RefreshScheduler scheduler(2);
    std::atomic<bool> ran{false};
    scheduler.post([&ran]() { ran = true; });
    expect(waitFor([&]() { return ran.load(); }), "posted work runs");

    scheduler.stop();
    expect(!scheduler.running(), "stopped scheduler reports not running");
    scheduler.stop();

    std::atomic<int> late{0};
    TaskHandle handle = scheduler.scheduleEvery(1ms, [&late]() { ++late; });
    scheduler.post([&late]() { ++late; });
    expect(!handle.active(), "schedule after stop yields inactive handle");
    std::this_thread::sleep_for(20ms);
    expect(late.load() == 0, "nothing runs after stop");
}

}  // namespace

int main() {
    periodicAndCancel();
    adaptiveFinish();
    noSelfOverlap();
    throwingTaskRetries();
    postAndStop();

    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_refresh_scheduler passed\n";
    return 0;
}
