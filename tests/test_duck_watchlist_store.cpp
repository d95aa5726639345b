#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "adapters/duckdb/DuckWatchlistStore.hpp"

using lmv::adapters::duckdb::DuckWatchlistStore;
using lmv::domain::WatchlistEntry;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAILED: " << message << '\n';
        ++failures;
    }
}

WatchlistEntry entry(const std::string& id, const std::string& venue, const std::string& symbol, long long addedAt) {
    WatchlistEntry out;
    out.id = id;
    out.exchangeId = venue;
    out.symbol = symbol;
    out.addedAt = addedAt;
    return out;
}

}  // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "lmv_duck_store_test";
    std::filesystem::remove_all(dir);
    const auto dbPath = (dir / "nested" / "watchlist.duckdb").string();

    try {
        DuckWatchlistStore store(dbPath);
        expect(store.list().empty(), "missing database lists nothing");

        store.migrate();
        expect(std::filesystem::exists(dbPath), "database created with its directory");
        store.migrate();

        store.upsert(entry("kraken:xbtusd", "kraken", "XBTUSD", 200));
        store.upsert(entry("binance:ethusdt", "binance", "ETHUSDT", 100));
        auto labelled = entry("binance:btcusdt", "binance", "BTCUSDT", 100);
        labelled.displayName = "Bitcoin";
        store.upsert(labelled);

        auto listed = store.list();
        expect(listed.size() == 3, "three entries stored");
        if (listed.size() == 3) {
            expect(listed[0].id == "binance:btcusdt" && listed[1].id == "binance:ethusdt", "ordered by time then id");
            expect(listed[2].id == "kraken:xbtusd", "newest last");
            expect(listed[0].displayName && *listed[0].displayName == "Bitcoin", "display name kept");
            expect(!listed[1].displayName, "absent display name stays absent");
            expect(listed[2].exchangeId == "kraken" && listed[2].symbol == "XBTUSD", "venue and symbol kept");
        }

        store.upsert(entry("kraken:xbtusd", "kraken", "XBTUSD", 50));
        listed = store.list();
        expect(listed.size() == 3 && listed[0].id == "kraken:xbtusd", "upsert replaces by id");

        expect(store.remove("binance:ethusdt"), "existing entry removed");
        expect(!store.remove("binance:ethusdt"), "second remove reports nothing removed");
        expect(store.list().size() == 2, "two entries left");

        DuckWatchlistStore reopened(dbPath);
        expect(reopened.list().size() == 2, "entries persist across instances");
    }
    catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << '\n';
        ++failures;
    }

    std::filesystem::remove_all(dir);
    if (failures > 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return 1;
    }
    std::cout << "test_duck_watchlist_store passed\n";
    return 0;
}
