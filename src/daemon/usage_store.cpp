#include "daemon/usage_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

namespace ccmonitor {

namespace {

constexpr int kBusyTimeoutMs = 2000;

constexpr const char *kSchema =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

std::runtime_error sqliteError(sqlite3 *db, const std::string &action)
{
    return std::runtime_error(action + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

// One prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(m_db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw sqliteError(m_db, "prepare");
        }
    }

    ~Statement()
    {
        sqlite3_finalize(m_stmt);
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    Statement &bind(int index, const std::string &value)
    {
        if (sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT)
            != SQLITE_OK) {
            throw sqliteError(m_db, "bind");
        }
        return *this;
    }

    // true while a row is available.
    bool nextRow()
    {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw sqliteError(m_db, "step");
        }
        return false;
    }

    std::string text(int column) const
    {
        const auto *value = sqlite3_column_text(m_stmt, column);
        return value ? reinterpret_cast<const char *>(value) : std::string();
    }

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_stmt = nullptr;
};

} // namespace

struct UsageStore::Impl {
    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
        }
    }

    sqlite3 *db = nullptr;
};

std::string UsageStore::databasePath()
{
    const char *home = std::getenv("HOME");
    const std::filesystem::path base = home ? home : ".";
    return (base / ".local/share/ccmonitor/ccmonitor.db").string();
}

UsageStore::UsageStore()
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path = databasePath();
    std::filesystem::create_directories(path.parent_path());

    // Impl closes the handle when anything below throws.
    if (sqlite3_open(path.string().c_str(), &impl->db) != SQLITE_OK) {
        throw sqliteError(impl->db, "open " + path.string());
    }

    // The worker writes while main may still read at startup.
    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);

    char *message = nullptr;
    if (sqlite3_exec(impl->db, kSchema, nullptr, nullptr, &message) != SQLITE_OK) {
        const std::string detail = message ? message : "schema";
        sqlite3_free(message);
        throw std::runtime_error("create schema: " + detail);
    }
}

UsageStore::~UsageStore() = default;

std::optional<std::string> UsageStore::getMeta(const std::string &key) const
{
    Statement query(impl->db, "SELECT value FROM meta WHERE key = ?1;");
    query.bind(1, key);
    if (!query.nextRow()) {
        return std::nullopt;
    }
    return query.text(0);
}

void UsageStore::setMeta(const std::string &key, const std::string &value)
{
    Statement upsert(impl->db,
                     "INSERT INTO meta (key, value) VALUES (?1, ?2) "
                     "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    upsert.bind(1, key).bind(2, value);
    upsert.nextRow();
}

bool UsageStore::integrityCheck(std::string *message) const
{
    try {
        Statement check(impl->db, "PRAGMA quick_check;");
        const std::string result = check.nextRow() ? check.text(0) : "no result";
        if (message) {
            *message = result;
        }
        return result == "ok";
    } catch (const std::runtime_error &ex) {
        if (message) {
            *message = ex.what();
        }
        return false;
    }
}

} // namespace ccmonitor
