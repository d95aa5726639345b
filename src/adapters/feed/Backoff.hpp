#pragma once

#include <algorithm>
#include <chrono>
#include <optional>

#include "domain/Types.h"

namespace lmv::adapters::feed {

struct BackoffPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{30000};
    int failAfter{5};

    // base * 2^(failures-1), capped.
    std::chrono::milliseconds delayFor(int failures) const {
        if (failures <= 0) {
            return std::chrono::milliseconds{0};
        }
        auto delay = base;
        for (int i = 1; i < failures && delay < cap; ++i) {
            delay *= 2;
        }
        return std::min(delay, cap);
    }
};

// Tracks consecutive failures and reports connection state changes.
class RetryState {
public:
    explicit RetryState(BackoffPolicy policy) : policy_(policy) {}

    // Returns the new state when it changed.
    std::optional<domain::ConnectionState> onSuccess() {
        failures_ = 0;
        return transition_(domain::ConnectionState::Connected);
    }

    std::optional<domain::ConnectionState> onFailure() {
        ++failures_;
        const auto next = failures_ >= policy_.failAfter ? domain::ConnectionState::Failed
                                                          : domain::ConnectionState::Reconnecting;
        return transition_(next);
    }

    std::chrono::milliseconds nextDelay() const { return policy_.delayFor(failures_); }
    int failures() const noexcept { return failures_; }
    const BackoffPolicy& policy() const noexcept { return policy_; }

private:
    std::optional<domain::ConnectionState> transition_(domain::ConnectionState next) {
        if (state_ && *state_ == next) {
            return std::nullopt;
        }
        state_ = next;
        return next;
    }

    BackoffPolicy policy_;
    int failures_{0};
    std::optional<domain::ConnectionState> state_;
};

}  // namespace lmv::adapters::feed
