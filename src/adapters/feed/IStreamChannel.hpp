#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lmv::adapters::feed {

// Blocking message channel for one (venue, symbol). open() and read() throw
// domain::TransportError; close() may be called from another thread and must
// make a blocked read() return.
class IStreamChannel {
public:
    virtual ~IStreamChannel() = default;

    virtual void open(const std::string& venue, const std::string& symbol) = 0;
    // Next text message, or nullopt once the channel has been closed.
    virtual std::optional<std::string> read() = 0;
    virtual void close() noexcept = 0;
};

using StreamChannelFactory = std::function<std::unique_ptr<IStreamChannel>()>;

}  // namespace lmv::adapters::feed
