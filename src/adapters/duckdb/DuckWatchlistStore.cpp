#include "adapters/duckdb/DuckWatchlistStore.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "logging/Log.h"

namespace fs = std::filesystem;

namespace lmv::adapters::duckdb {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::DB;

// DuckDB's own vector alias keeps Execute(values) on the non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

std::runtime_error make_error(const std::string& what, const std::string& detail) {
    return std::runtime_error("DuckWatchlistStore: " + what + ": " + detail);
}

void ensureParentDirectory(const fs::path& dbPath) {
    if (!dbPath.has_parent_path()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dbPath.parent_path(), ec);
    if (ec) {
        throw make_error("unable to create directory '" + dbPath.parent_path().string() + "'", ec.message());
    }
}

template <typename Result>
void throwIfFailed(const Result& result, const std::string& what) {
    if (!result || result->HasError()) {
        throw make_error(what, result ? result->GetError() : std::string{"unknown error"});
    }
}

std::string valueToString(const ::duckdb::Value& value) {
    return value.IsNull() ? std::string{} : value.ToString();
}

}  // namespace

DuckWatchlistStore::DuckWatchlistStore(std::string dbPath) : dbPath_(std::move(dbPath)) {}

void DuckWatchlistStore::migrate() {
    const fs::path dbPath{dbPath_};
    ensureParentDirectory(dbPath);

    ::duckdb::DuckDB db(dbPath.string());
    ::duckdb::Connection connection(db);

    static constexpr auto kCreateWatchlistTable = R"SQL(
        CREATE TABLE IF NOT EXISTS watchlist (
            id TEXT PRIMARY KEY,
            exchange_id TEXT NOT NULL,
            symbol TEXT NOT NULL,
            display_name TEXT,
            added_at BIGINT NOT NULL
        )
    )SQL";

    auto result = connection.Query(kCreateWatchlistTable);
    throwIfFailed(result, "migration failed");
    LOG_INFO(kLogCategory, "DuckWatchlistStore migration finished for %s", dbPath.string().c_str());
}

std::vector<domain::WatchlistEntry> DuckWatchlistStore::list() const {
    fs::path dbPath{dbPath_};
    std::error_code ec;
    if (!fs::exists(dbPath, ec) || fs::is_directory(dbPath, ec)) {
        if (ec) {
            LOG_WARN(kLogCategory,
                     "DuckWatchlistStore unable to stat database path=%s error=%s",
                     dbPath_.c_str(),
                     ec.message().c_str());
        }
        return {};
    }

    ::duckdb::DuckDB database(dbPath.string());
    ::duckdb::Connection connection(database);

    auto result = connection.Query(
        "SELECT id, exchange_id, symbol, display_name, added_at FROM watchlist ORDER BY added_at ASC, id ASC");
    throwIfFailed(result, "list failed");

    std::vector<domain::WatchlistEntry> entries;
    while (auto chunk = result->Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::WatchlistEntry entry;
            entry.id = valueToString(chunk->GetValue(0, row));
            entry.exchangeId = valueToString(chunk->GetValue(1, row));
            entry.symbol = valueToString(chunk->GetValue(2, row));
            const auto displayName = chunk->GetValue(3, row);
            if (!displayName.IsNull()) {
                entry.displayName = displayName.ToString();
            }
            const auto addedAt = chunk->GetValue(4, row);
            entry.addedAt = addedAt.IsNull() ? 0 : addedAt.GetValue<std::int64_t>();
            if (entry.id.empty() || entry.symbol.empty()) {
                LOG_WARN(kLogCategory, "DuckWatchlistStore skipping incomplete row");
                continue;
            }
            entries.push_back(std::move(entry));
        }
    }
    LOG_DEBUG(kLogCategory, "DuckWatchlistStore loaded %zu entries", entries.size());
    return entries;
}

void DuckWatchlistStore::upsert(const domain::WatchlistEntry& entry) {
    if (entry.id.empty() || entry.symbol.empty()) {
        throw make_error("upsert rejected", "entry id and symbol are required");
    }

    const fs::path dbPath{dbPath_};
    ensureParentDirectory(dbPath);

    ::duckdb::DuckDB database(dbPath.string());
    ::duckdb::Connection connection(database);

    auto statement = connection.Prepare(
        "INSERT OR REPLACE INTO watchlist (id, exchange_id, symbol, display_name, added_at) "
        "VALUES (?, ?, ?, ?, ?)");
    throwIfFailed(statement, "prepare upsert failed");

    DuckdbValueVector parameters;
    parameters.reserve(5);
    parameters.emplace_back(entry.id);
    parameters.emplace_back(entry.exchangeId);
    parameters.emplace_back(entry.symbol);
    if (entry.displayName) {
        parameters.emplace_back(*entry.displayName);
    }
    else {
        parameters.emplace_back(::duckdb::Value(::duckdb::LogicalType::VARCHAR));
    }
    parameters.emplace_back(::duckdb::Value::BIGINT(entry.addedAt));

    auto result = statement->Execute(parameters);
    throwIfFailed(result, "upsert failed");
    LOG_DEBUG(kLogCategory, "DuckWatchlistStore upserted id=%s", entry.id.c_str());
}

bool DuckWatchlistStore::remove(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    fs::path dbPath{dbPath_};
    std::error_code ec;
    if (!fs::exists(dbPath, ec)) {
        return false;
    }

    ::duckdb::DuckDB database(dbPath.string());
    ::duckdb::Connection connection(database);

    auto statement = connection.Prepare("DELETE FROM watchlist WHERE id = ?");
    throwIfFailed(statement, "prepare remove failed");

    DuckdbValueVector parameters;
    parameters.emplace_back(id);
    auto result = statement->Execute(parameters);
    throwIfFailed(result, "remove failed");

    std::int64_t affected = 0;
    if (auto chunk = result->Fetch()) {
        if (chunk->size() > 0) {
            const auto value = chunk->GetValue(0, 0);
            if (!value.IsNull()) {
                affected = value.GetValue<std::int64_t>();
            }
        }
    }
    return affected > 0;
}

}  // namespace lmv::adapters::duckdb
