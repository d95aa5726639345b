#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "adapters/feed/Backoff.hpp"
#include "adapters/feed/IQuoteFetcher.hpp"
#include "adapters/feed/ITickSource.h"

namespace lmv::adapters::feed {

struct PollingOptions {
    std::chrono::milliseconds interval{2000};
    BackoffPolicy backoff{};
};

/**
 * Re-fetches the latest quote on a fixed interval.
 *
 * Every subscription polls from its own worker thread, so a fetch that hangs
 * until the HTTP timeout only stalls its own symbol. cancel() stops delivery
 * at once and never waits for an in-flight fetch; the worker exits when that
 * fetch returns. Destroying the source joins every worker it started.
 *
 * A quote identical to the previous one (same timestamp and price) emits
 * nothing. Failed fetches are retried with exponential backoff; after
 * `failAfter` consecutive failures the state becomes `failed` and retries
 * continue at the capped delay.
 */
class PollingTickSource : public ITickSource {
public:
    explicit PollingTickSource(std::shared_ptr<IQuoteFetcher> fetcher, PollingOptions options = {});
    ~PollingTickSource() override;

    PollingTickSource(const PollingTickSource&) = delete;
    PollingTickSource& operator=(const PollingTickSource&) = delete;

    Subscription subscribe(const std::string& venue,
                           const std::string& symbol,
                           TickCallback onTick,
                           StateCallback onState) override;

    const char* mode() const noexcept override { return "poll"; }

    // Workers still running, including cancelled ones finishing a fetch.
    std::size_t liveWorkers() const;

private:
    class Worker;

    std::shared_ptr<IQuoteFetcher> fetcher_;
    PollingOptions options_;
    mutable std::mutex workersMutex_;
    std::vector<std::shared_ptr<Worker>> workers_;
};

}  // namespace lmv::adapters::feed
