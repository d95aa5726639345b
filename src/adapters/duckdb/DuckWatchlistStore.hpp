#pragma once

#include <string>
#include <vector>

#include "adapters/storage/IWatchlistStore.hpp"

namespace lmv::adapters::duckdb {

class DuckWatchlistStore : public storage::IWatchlistStore {
public:
    explicit DuckWatchlistStore(std::string dbPath = "data/watchlist.duckdb");

    // Creates the database directory and the watchlist table when missing.
    void migrate();

    std::vector<domain::WatchlistEntry> list() const override;
    void upsert(const domain::WatchlistEntry& entry) override;
    bool remove(const std::string& id) override;

    const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
};

}  // namespace lmv::adapters::duckdb
