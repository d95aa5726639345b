#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "core/TickSequencer.h"
#include "domain/Types.h"

namespace lmv::adapters::feed {

using TickCallback = std::function<void(const core::TickUpdate&)>;
using StateCallback = std::function<void(domain::ConnectionState)>;

class SubscriptionControl {
public:
    virtual ~SubscriptionControl() = default;
    // Must be idempotent and must not throw.
    virtual void cancel() noexcept = 0;
    virtual void setRefreshInterval(std::chrono::milliseconds interval) = 0;
    virtual bool active() const noexcept = 0;
};

// Move-only owner of a live subscription. Cancels on destruction.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::shared_ptr<SubscriptionControl> control) : control_(std::move(control)) {}
    ~Subscription() { cancel(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept = default;
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            control_ = std::move(other.control_);
        }
        return *this;
    }

    void cancel() noexcept {
        if (auto control = std::move(control_)) {
            control->cancel();
        }
    }

    void setRefreshInterval(std::chrono::milliseconds interval) {
        if (control_) {
            control_->setRefreshInterval(interval);
        }
    }

    bool active() const noexcept { return control_ && control_->active(); }

private:
    std::shared_ptr<SubscriptionControl> control_;
};

/**
 * Source of normalized ticks for one (venue, symbol).
 *
 * Transport failures never reach the caller: implementations retry with
 * backoff and report them through `onState` only. Ticks are delivered in
 * sequence order for a subscription, never concurrently with each other.
 */
class ITickSource {
public:
    virtual ~ITickSource() = default;

    virtual Subscription subscribe(const std::string& venue,
                                   const std::string& symbol,
                                   TickCallback onTick,
                                   StateCallback onState) = 0;

    virtual const char* mode() const noexcept = 0;
};

}  // namespace lmv::adapters::feed
