#pragma once

#include <memory>
#include <string>

#include "adapters/feed/Backoff.hpp"
#include "adapters/feed/IStreamChannel.hpp"
#include "adapters/feed/ITickSource.h"

namespace lmv::adapters::feed {

/**
 * Message driven tick source. Each subscription owns a reader thread and a
 * fresh channel per connection attempt; dropped connections are reopened
 * with the same backoff policy as polling.
 *
 * cancel() closes the channel and stops delivery without joining the reader,
 * so a connect stuck in DNS or TCP never blocks the caller. The reader exits
 * and releases the channel once the pending operation returns.
 */
class PushTickSource : public ITickSource {
public:
    PushTickSource(StreamChannelFactory factory, BackoffPolicy backoff = {});

    Subscription subscribe(const std::string& venue,
                           const std::string& symbol,
                           TickCallback onTick,
                           StateCallback onState) override;

    const char* mode() const noexcept override { return "push"; }

private:
    StreamChannelFactory factory_;
    BackoffPolicy backoff_;
};

}  // namespace lmv::adapters::feed
