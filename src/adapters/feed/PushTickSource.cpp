#include "adapters/feed/PushTickSource.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include "adapters/feed/TickNormalizer.hpp"
#include "common/Metrics.hpp"
#include "core/TickSequencer.h"
#include "domain/Errors.h"
#include "logging/Log.h"

namespace lmv::adapters::feed {

namespace {

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("PushTickSource: " + message);
}

class PushControl : public SubscriptionControl, public std::enable_shared_from_this<PushControl> {
public:
    PushControl(std::string venue,
                std::string symbol,
                StreamChannelFactory factory,
                BackoffPolicy backoff,
                TickCallback onTick,
                StateCallback onState)
        : venue_(std::move(venue)),
          symbol_(std::move(symbol)),
          factory_(std::move(factory)),
          retry_(backoff),
          onTick_(std::move(onTick)),
          onState_(std::move(onState)) {}

    ~PushControl() override {
        cancel();
        joinWorker_();
    }

    // The reader thread keeps the control alive until it returns.
    void start() {
        auto self = shared_from_this();
        worker_ = std::thread([self]() { self->run_(); });
    }

    void cancel() noexcept override {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (channel_) {
                channel_->close();
            }
        }
        cv_.notify_all();
        // Waits out a callback already running; a blocked open() or read()
        // returns on its own once the channel is closed.
        if (worker_.get_id() != std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(deliverMutex_);
        }
        LOG_DEBUG(logging::LogCategory::FEED, "Push stream cancelled for %s:%s", venue_.c_str(), symbol_.c_str());
    }

    void setRefreshInterval(std::chrono::milliseconds) override {}

    bool active() const noexcept override { return running_.load(std::memory_order_acquire); }

private:
    void joinWorker_() noexcept {
        if (!worker_.joinable()) {
            return;
        }
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        }
        else {
            worker_.join();
        }
    }

    void run_() {
        while (running_.load(std::memory_order_acquire)) {
            std::shared_ptr<IStreamChannel> channel;
            try {
                channel = std::shared_ptr<IStreamChannel>(factory_());
                if (!channel) {
                    throw domain::TransportError("channel factory returned null");
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!running_.load(std::memory_order_acquire)) {
                        break;
                    }
                    channel_ = channel;
                }
                channel->open(venue_, symbol_);
                if (auto changed = retry_.onSuccess()) {
                    emitState_(*changed);
                }
                LOG_INFO(logging::LogCategory::NET, "Push stream open for %s:%s", venue_.c_str(), symbol_.c_str());

                while (running_.load(std::memory_order_acquire)) {
                    auto message = channel->read();
                    if (!message) {
                        if (running_.load(std::memory_order_acquire)) {
                            throw domain::TransportError("stream closed by peer");
                        }
                        break;
                    }
                    dispatch_(*message);
                }
            }
            catch (const domain::TransportError& ex) {
                if (!running_.load(std::memory_order_acquire)) {
                    break;
                }
                backoffAfter_(ex.what());
            }
            catch (const std::exception& ex) {
                if (!running_.load(std::memory_order_acquire)) {
                    break;
                }
                backoffAfter_(ex.what());
            }
            releaseChannel_(channel);
        }
        releaseChannel_(nullptr);
    }

    void dispatch_(const std::string& message) {
        std::vector<domain::QuoteSample> samples;
        try {
            samples = TickNormalizer::fromPushMessage(message);
        }
        catch (const domain::MalformedTickError& ex) {
            metrics::Registry::instance().incrementCounter("ticks_malformed");
            LOG_WARN(logging::LogCategory::FEED, "Malformed push message for %s:%s dropped: %s", venue_.c_str(),
                     symbol_.c_str(), ex.what());
            return;
        }
        std::lock_guard<std::mutex> lock(deliverMutex_);
        for (const auto& sample : samples) {
            auto update = sequencer_.accept(sample);
            if (update && running_.load(std::memory_order_acquire) && onTick_) {
                onTick_(*update);
            }
        }
    }

    void backoffAfter_(const char* what) {
        metrics::Registry::instance().incrementCounter("transport_failures");
        auto changed = retry_.onFailure();
        const auto delay = retry_.nextDelay();
        LOG_WARN(logging::LogCategory::NET, "Push stream %s:%s failed (%d in a row), reconnect in %lld ms: %s",
                 venue_.c_str(), symbol_.c_str(), retry_.failures(), static_cast<long long>(delay.count()), what);
        if (changed) {
            emitState_(*changed);
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, delay, [this]() { return !running_.load(std::memory_order_acquire); });
    }

    void releaseChannel_(const std::shared_ptr<IStreamChannel>& channel) {
        std::shared_ptr<IStreamChannel> released;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!channel || channel_ == channel) {
                released = std::move(channel_);
            }
        }
        if (released) {
            released->close();
        }
    }

    void emitState_(domain::ConnectionState state) {
        std::lock_guard<std::mutex> lock(deliverMutex_);
        if (!running_.load(std::memory_order_acquire) || !onState_) {
            return;
        }
        onState_(state);
    }

    const std::string venue_;
    const std::string symbol_;
    StreamChannelFactory factory_;
    RetryState retry_;
    core::TickSequencer sequencer_;
    TickCallback onTick_;
    StateCallback onState_;

    std::atomic<bool> running_{true};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<IStreamChannel> channel_;
    std::mutex deliverMutex_;
    std::thread worker_;
};

}  // namespace

PushTickSource::PushTickSource(StreamChannelFactory factory, BackoffPolicy backoff)
    : factory_(std::move(factory)), backoff_(backoff) {
    if (!factory_) {
        throw make_error("channel factory is required");
    }
}

Subscription PushTickSource::subscribe(const std::string& venue,
                                       const std::string& symbol,
                                       TickCallback onTick,
                                       StateCallback onState) {
    if (venue.empty() || symbol.empty()) {
        throw make_error("venue and symbol are required");
    }
    auto control = std::make_shared<PushControl>(venue, symbol, factory_, backoff_, std::move(onTick),
                                                 std::move(onState));
    control->start();
    return Subscription(control);
}

}  // namespace lmv::adapters::feed
