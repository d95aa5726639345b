#pragma once

#include <stdexcept>
#include <string>

namespace lmv::domain {

// Fetch, handshake or socket failure. Raised and caught inside the feed
// adapters only; callers observe it as a connection state change.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Payload without a usable timestamp or price. The tick is dropped.
class MalformedTickError : public std::runtime_error {
public:
    explicit MalformedTickError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace lmv::domain
