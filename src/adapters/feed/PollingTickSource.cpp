#include "adapters/feed/PollingTickSource.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

#include "common/Metrics.hpp"
#include "domain/Errors.h"
#include "logging/Log.h"

namespace lmv::adapters::feed {

namespace {

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("PollingTickSource: " + message);
}

}  // namespace

class PollingTickSource::Worker : public SubscriptionControl {
public:
    Worker(std::string venue,
           std::string symbol,
           std::shared_ptr<IQuoteFetcher> fetcher,
           PollingOptions options,
           TickCallback onTick,
           StateCallback onState)
        : venue_(std::move(venue)),
          symbol_(std::move(symbol)),
          fetcher_(std::move(fetcher)),
          retry_(options.backoff),
          onTick_(std::move(onTick)),
          onState_(std::move(onState)),
          intervalMs_(options.interval.count()) {}

    ~Worker() override {
        cancel();
        join();
    }

    void start() {
        thread_ = std::thread([this]() { run_(); });
    }

    void cancel() noexcept override {
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(waitMutex_);
        }
        wake_.notify_all();
        // Waits out a callback already running, never the fetch itself.
        if (workerId_.load(std::memory_order_acquire) != std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(deliverMutex_);
        }
        LOG_DEBUG(logging::LogCategory::FEED, "Polling cancelled for %s:%s", venue_.c_str(), symbol_.c_str());
    }

    void setRefreshInterval(std::chrono::milliseconds interval) override {
        if (interval.count() <= 0) {
            return;
        }
        if (intervalMs_.exchange(interval.count(), std::memory_order_acq_rel) == interval.count()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            intervalChanged_ = true;
        }
        wake_.notify_all();
    }

    bool active() const noexcept override { return !cancelled_.load(std::memory_order_acquire); }

    bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }

    void join() noexcept {
        if (!thread_.joinable()) {
            return;
        }
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        }
        else {
            thread_.join();
        }
    }

private:
    void run_() {
        workerId_.store(std::this_thread::get_id(), std::memory_order_release);
        std::chrono::milliseconds delay{0};
        while (sleep_(delay)) {
            delay = pollOnce_();
        }
        finished_.store(true, std::memory_order_release);
    }

    // Returns false once cancelled. A new refresh interval restarts a regular
    // wait; a backoff wait runs to the end.
    bool sleep_(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(waitMutex_);
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (!cancelled_.load(std::memory_order_acquire)) {
            if (intervalChanged_) {
                intervalChanged_ = false;
                if (!failing_) {
                    deadline = std::chrono::steady_clock::now() + interval_();
                }
            }
            if (wake_.wait_until(lock, deadline) == std::cv_status::timeout) {
                return !cancelled_.load(std::memory_order_acquire);
            }
        }
        return false;
    }

    std::chrono::milliseconds pollOnce_() {
        domain::QuoteSample sample;
        try {
            sample = fetcher_->fetch(venue_, symbol_);
        }
        catch (const domain::TransportError& ex) {
            return onTransportFailure_(ex.what());
        }
        catch (const domain::MalformedTickError& ex) {
            metrics::Registry::instance().incrementCounter("ticks_malformed");
            LOG_WARN(logging::LogCategory::FEED, "Malformed quote for %s:%s dropped: %s", venue_.c_str(),
                     symbol_.c_str(), ex.what());
            reportSuccess_();
            return interval_();
        }

        reportSuccess_();
        if (lastSample_ && lastSample_->timestamp == sample.timestamp && lastSample_->price == sample.price) {
            return interval_();
        }
        lastSample_ = sample;

        if (auto update = sequencer_.accept(sample)) {
            deliver_([this, &update]() {
                if (onTick_) {
                    onTick_(*update);
                }
            });
        }
        return interval_();
    }

    std::chrono::milliseconds onTransportFailure_(const char* what) {
        metrics::Registry::instance().incrementCounter("transport_failures");
        auto changed = retry_.onFailure();
        setFailing_(true);
        const auto delay = retry_.nextDelay();
        LOG_WARN(logging::LogCategory::NET, "Poll %s:%s failed (%d in a row), retry in %lld ms: %s", venue_.c_str(),
                 symbol_.c_str(), retry_.failures(), static_cast<long long>(delay.count()), what);
        if (changed) {
            emitState_(*changed);
        }
        return delay;
    }

    void reportSuccess_() {
        setFailing_(false);
        if (auto changed = retry_.onSuccess()) {
            emitState_(*changed);
        }
    }

    void setFailing_(bool failing) {
        std::lock_guard<std::mutex> lock(waitMutex_);
        failing_ = failing;
    }

    void emitState_(domain::ConnectionState state) {
        deliver_([this, state]() {
            LOG_INFO(logging::LogCategory::FEED, "%s:%s %s", venue_.c_str(), symbol_.c_str(), domain::to_string(state));
            if (onState_) {
                onState_(state);
            }
        });
    }

    template <typename Fn>
    void deliver_(Fn&& fn) {
        std::lock_guard<std::mutex> lock(deliverMutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            fn();
        }
    }

    std::chrono::milliseconds interval_() const {
        return std::chrono::milliseconds{intervalMs_.load(std::memory_order_acquire)};
    }

    const std::string venue_;
    const std::string symbol_;
    std::shared_ptr<IQuoteFetcher> fetcher_;
    RetryState retry_;
    core::TickSequencer sequencer_;
    std::optional<domain::QuoteSample> lastSample_;
    TickCallback onTick_;
    StateCallback onState_;

    std::atomic<long long> intervalMs_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::atomic<std::thread::id> workerId_{};

    std::mutex waitMutex_;
    std::condition_variable wake_;
    bool intervalChanged_{false};
    bool failing_{false};

    std::mutex deliverMutex_;
    std::thread thread_;
};

PollingTickSource::PollingTickSource(std::shared_ptr<IQuoteFetcher> fetcher, PollingOptions options)
    : fetcher_(std::move(fetcher)), options_(options) {
    if (!fetcher_) {
        throw make_error("fetcher is required");
    }
    if (options_.interval.count() <= 0) {
        throw make_error("interval must be positive");
    }
}

PollingTickSource::~PollingTickSource() {
    std::vector<std::shared_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        worker->cancel();
        worker->join();
    }
}

Subscription PollingTickSource::subscribe(const std::string& venue,
                                          const std::string& symbol,
                                          TickCallback onTick,
                                          StateCallback onState) {
    if (venue.empty() || symbol.empty()) {
        throw make_error("venue and symbol are required");
    }
    auto worker = std::make_shared<Worker>(venue, symbol, fetcher_, options_, std::move(onTick), std::move(onState));
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        for (auto& done : workers_) {
            if (done->finished()) {
                done->join();
            }
        }
        workers_.erase(std::remove_if(workers_.begin(), workers_.end(),
                                      [](const std::shared_ptr<Worker>& w) { return w->finished(); }),
                       workers_.end());
        workers_.push_back(worker);
    }
    worker->start();
    LOG_INFO(logging::LogCategory::FEED, "Polling %s:%s every %lld ms", venue.c_str(), symbol.c_str(),
             static_cast<long long>(options_.interval.count()));
    return Subscription(worker);
}

std::size_t PollingTickSource::liveWorkers() const {
    std::lock_guard<std::mutex> lock(workersMutex_);
    return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(),
                                                  [](const std::shared_ptr<Worker>& w) { return !w->finished(); }));
}

}  // namespace lmv::adapters::feed
