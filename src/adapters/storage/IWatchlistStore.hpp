#pragma once

#include <string>
#include <vector>

#include "domain/Types.h"

namespace lmv::adapters::storage {

class IWatchlistStore {
public:
    virtual ~IWatchlistStore() = default;

    // Entries ordered by addedAt, then id.
    virtual std::vector<domain::WatchlistEntry> list() const = 0;
    virtual void upsert(const domain::WatchlistEntry& entry) = 0;
    // Returns false when no entry had that id.
    virtual bool remove(const std::string& id) = 0;
};

}  // namespace lmv::adapters::storage
