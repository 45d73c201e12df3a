#include "store/entry_status_store.hpp"

#include <mutex>
#include <system_error>

#include <sqlite3.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace fluxsync {

namespace {

constexpr const char *kCreateEntryStatusTable =
    "CREATE TABLE IF NOT EXISTS entry_status ("
    "    id INTEGER PRIMARY KEY,"
    "    status TEXT NOT NULL,"
    "    last_updated_ms INTEGER NOT NULL,"
    "    pending_from_worker INTEGER NOT NULL DEFAULT 0,"
    "    pending_from_worker_ms INTEGER NOT NULL DEFAULT 0,"
    "    title TEXT,"
    "    url TEXT,"
    "    published_at TEXT,"
    "    feed_id INTEGER,"
    "    feed_title TEXT,"
    "    category_id INTEGER,"
    "    category_title TEXT"
    ");";

constexpr const char *kSelectColumns =
    "SELECT id, status, last_updated_ms, pending_from_worker, "
    "pending_from_worker_ms, title, url, published_at, feed_id, feed_title, "
    "category_id, category_title FROM entry_status";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(message);
    }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_done) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_done = true;
    }

private:
    sqlite3 *m_db;
    bool m_done = false;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

EntityStatusRecord recordFromRow(sqlite3_stmt *stmt)
{
    EntityStatusRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.status = parseStatusString(columnText(stmt, 1)).value_or(EntryStatus::Unread);
    record.lastUpdated = fromEpochMillis(sqlite3_column_int64(stmt, 2));
    record.pendingFromWorker = sqlite3_column_int(stmt, 3) != 0;
    record.pendingFromWorkerAt = fromEpochMillis(sqlite3_column_int64(stmt, 4));
    record.title = columnText(stmt, 5);
    record.url = columnText(stmt, 6);
    record.publishedAt = columnText(stmt, 7);
    record.feedId = sqlite3_column_int64(stmt, 8);
    record.feedTitle = columnText(stmt, 9);
    record.categoryId = sqlite3_column_int64(stmt, 10);
    record.categoryTitle = columnText(stmt, 11);
    return record;
}

} // namespace

EntryNotFoundError::EntryNotFoundError(int64_t entryId)
    : StoreError("no local record for entry " + std::to_string(entryId))
    , m_entryId(entryId)
{
}

struct EntryStatusStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

EntryStatusStore::EntryStatusStore(const std::filesystem::path &dbPath)
    : impl(std::make_unique<Impl>())
{
    std::error_code error;
    std::filesystem::create_directories(dbPath.parent_path(), error);
    if (error) {
        throw StoreError("failed to create data directory " + dbPath.parent_path().string());
    }

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StoreError("failed to open entry database: " + message);
    }
    sqlite3_busy_timeout(impl->db, 2000);

    execOrThrow(impl->db, kCreateEntryStatusTable);
}

EntryStatusStore::~EntryStatusStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::optional<EntityStatusRecord> EntryStatusStore::load(int64_t entryId) const
{
    if (!isValidEntityId(entryId)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string(kSelectColumns) + " WHERE id = ?;";
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, entryId);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return recordFromRow(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("failed to load entry: ") + sqlite3_errmsg(impl->db));
    }
    return std::nullopt;
}

bool EntryStatusStore::write(int64_t entryId, EntryStatus status, const WriteOptions &options)
{
    if (!isValidEntityId(entryId)) {
        throw StoreError("invalid entry id " + std::to_string(entryId));
    }

    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db);

    int64_t lastUpdatedMs = 0;
    {
        Statement select(impl->db, "SELECT last_updated_ms FROM entry_status WHERE id = ?;");
        sqlite3_bind_int64(select.get(), 1, entryId);
        const int rc = sqlite3_step(select.get());
        if (rc == SQLITE_DONE) {
            throw EntryNotFoundError(entryId);
        }
        if (rc != SQLITE_ROW) {
            throw StoreError(std::string("failed to read entry: ") + sqlite3_errmsg(impl->db));
        }
        lastUpdatedMs = sqlite3_column_int64(select.get(), 0);
    }

    if (options.unchangedSince && lastUpdatedMs > toEpochMillis(*options.unchangedSince)) {
        FSLOG_DEBUG(QStringLiteral("EntryStatusStore"),
                    QStringLiteral("write"),
                    QStringLiteral("stale_write_skipped"),
                    QStringLiteral("newer_local_change"),
                    QStringLiteral("timestamp_guard"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entryId", entryId},
                                    {"status", toStatusString(status)}}));
        return false;
    }

    const int64_t nowMs = toEpochMillis(std::chrono::system_clock::now());
    Statement update(impl->db,
                     "UPDATE entry_status SET status = ?, last_updated_ms = ?, "
                     "pending_from_worker = ?, pending_from_worker_ms = ? WHERE id = ?;");
    bindText(update.get(), 1, toStatusString(status));
    sqlite3_bind_int64(update.get(), 2, nowMs);
    sqlite3_bind_int(update.get(), 3, options.viaWorker ? 1 : 0);
    sqlite3_bind_int64(update.get(), 4, options.viaWorker ? nowMs : 0);
    sqlite3_bind_int64(update.get(), 5, entryId);
    if (sqlite3_step(update.get()) != SQLITE_DONE) {
        throw StoreError(std::string("failed to update entry: ") + sqlite3_errmsg(impl->db));
    }

    tx.commit();
    return true;
}

void EntryStatusStore::materialize(const EntityStatusRecord &record)
{
    if (!isValidEntityId(record.id)) {
        throw StoreError("invalid entry id " + std::to_string(record.id));
    }

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO entry_status (id, status, last_updated_ms, "
                   "pending_from_worker, pending_from_worker_ms, title, url, "
                   "published_at, feed_id, feed_title, category_id, category_title) "
                   "VALUES (?, ?, ?, 0, 0, ?, ?, ?, ?, ?, ?, ?) "
                   "ON CONFLICT(id) DO UPDATE SET status = excluded.status, "
                   "last_updated_ms = excluded.last_updated_ms, "
                   "pending_from_worker = 0, pending_from_worker_ms = 0, "
                   "title = excluded.title, url = excluded.url, "
                   "published_at = excluded.published_at, feed_id = excluded.feed_id, "
                   "feed_title = excluded.feed_title, category_id = excluded.category_id, "
                   "category_title = excluded.category_title;");
    sqlite3_bind_int64(stmt.get(), 1, record.id);
    bindText(stmt.get(), 2, toStatusString(record.status));
    sqlite3_bind_int64(stmt.get(), 3, toEpochMillis(std::chrono::system_clock::now()));
    bindText(stmt.get(), 4, record.title);
    bindText(stmt.get(), 5, record.url);
    bindText(stmt.get(), 6, record.publishedAt);
    sqlite3_bind_int64(stmt.get(), 7, record.feedId);
    bindText(stmt.get(), 8, record.feedTitle);
    sqlite3_bind_int64(stmt.get(), 9, record.categoryId);
    bindText(stmt.get(), 10, record.categoryTitle);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StoreError(std::string("failed to materialize entry: ") + sqlite3_errmsg(impl->db));
    }
}

bool EntryStatusStore::purge(int64_t entryId)
{
    if (!isValidEntityId(entryId)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "DELETE FROM entry_status WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, entryId);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StoreError(std::string("failed to purge entry: ") + sqlite3_errmsg(impl->db));
    }
    return sqlite3_changes(impl->db) > 0;
}

std::vector<EntityStatusRecord> EntryStatusStore::list() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string(kSelectColumns) + " ORDER BY id ASC;";
    Statement stmt(impl->db, sql.c_str());

    std::vector<EntityStatusRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        records.push_back(recordFromRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("failed to list entries: ") + sqlite3_errmsg(impl->db));
    }
    return records;
}

std::size_t EntryStatusStore::count() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT COUNT(*) FROM entry_status;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError(std::string("failed to count entries: ") + sqlite3_errmsg(impl->db));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

bool EntryStatusStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = sqlite3_errmsg(impl->db);
        }
        return false;
    }
    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace fluxsync
