#include "core/store/sqlite_preference_store.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <QByteArrayList>
#include <QJsonDocument>

#include <cmath>

namespace mm {

namespace {

double toEpochSeconds(const QDateTime& dt)
{
    return static_cast<double>(dt.toMSecsSinceEpoch()) / 1000.0;
}

QDateTime fromEpochSeconds(double seconds)
{
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(std::llround(seconds * 1000.0)));
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), static_cast<int>(utf8.size()), SQLITE_TRANSIENT);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

// Appends the WHERE clause for `query` to `sql`. Parameters are bound in
// the same order by bindFilter().
void appendFilter(QByteArray& sql, const EventQuery& query)
{
    QList<QByteArray> clauses;
    if (!query.kind.isEmpty()) {
        clauses.append("kind = ?");
    }
    if (query.sender.has_value()) {
        clauses.append("sender = ?");
    }
    if (query.from.isValid()) {
        clauses.append("timestamp >= ?");
    }
    if (query.to.isValid()) {
        clauses.append("timestamp < ?");
    }
    if (!clauses.isEmpty()) {
        sql += " WHERE ";
        sql += clauses.join(" AND ");
    }
}

int bindFilter(sqlite3_stmt* stmt, const EventQuery& query)
{
    int index = 1;
    if (!query.kind.isEmpty()) {
        bindText(stmt, index++, query.kind);
    }
    if (query.sender.has_value()) {
        bindText(stmt, index++, *query.sender);
    }
    if (query.from.isValid()) {
        sqlite3_bind_double(stmt, index++, toEpochSeconds(query.from));
    }
    if (query.to.isValid()) {
        sqlite3_bind_double(stmt, index++, toEpochSeconds(query.to));
    }
    return index;
}

} // anonymous namespace

SQLitePreferenceStore::~SQLitePreferenceStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SQLitePreferenceStore> SQLitePreferenceStore::open(const QString& dbPath,
                                                                   QString* errorOut)
{
    std::unique_ptr<SQLitePreferenceStore> store(new SQLitePreferenceStore());
    if (!store->init(dbPath, errorOut)) {
        return nullptr;
    }
    return store;
}

bool SQLitePreferenceStore::init(const QString& dbPath, QString* errorOut)
{
    const int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(m_db ? sqlite3_errmsg(m_db) : "out of memory");
        LOG_ERROR(mmStore, "Failed to open database %s: %s",
                  qUtf8Printable(dbPath), qUtf8Printable(message));
        if (errorOut) {
            *errorOut = message;
        }
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas)) {
        if (errorOut) {
            *errorOut = QStringLiteral("Failed to set connection pragmas");
        }
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db,
                "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='event_log'",
                -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = sqlite3_column_int(stmt, 0) > 0;
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        // journal_mode=WAL is a no-op for :memory:, which is fine.
        if (!execSql(kDatabasePragmas)) {
            LOG_WARN(mmStore, "Failed to set database pragmas");
        }
        if (!execSql(kSchemaV1)) {
            if (errorOut) {
                *errorOut = QStringLiteral("Failed to create schema");
            }
            return false;
        }
    }

    LOG_INFO(mmStore, "Preference store opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLitePreferenceStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(mmStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLitePreferenceStore::fail(ErrorInfo* errorOut, const char* operation)
{
    const QString message = QStringLiteral("%1 failed: %2")
                                .arg(QString::fromUtf8(operation),
                                     QString::fromUtf8(sqlite3_errmsg(m_db)));
    LOG_ERROR(mmStore, "%s", qUtf8Printable(message));
    return setError(errorOut, CoreError::StorageFailure, message);
}

// ── Preferences ─────────────────────────────────────────────

std::optional<QString> SQLitePreferenceStore::getPreference(const QString& key,
                                                            ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT value FROM preferences WHERE key = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, "getPreference");
        return std::nullopt;
    }
    bindText(stmt, 1, key);

    std::optional<QString> result;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        result = columnText(stmt, 0);
    } else if (rc != SQLITE_DONE) {
        fail(errorOut, "getPreference");
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLitePreferenceStore::setPreference(const QString& key, const QString& value,
                                          ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const char* sql = R"(
        INSERT INTO preferences (key, value, updated_at) VALUES (?1, ?2, ?3)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value,
                                       updated_at = excluded.updated_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(errorOut, "setPreference");
    }
    bindText(stmt, 1, key);
    bindText(stmt, 2, value);
    sqlite3_bind_double(stmt, 3, toEpochSeconds(QDateTime::currentDateTimeUtc()));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(errorOut, "setPreference");
    }
    return true;
}

// ── Event log ───────────────────────────────────────────────

std::optional<int64_t> SQLitePreferenceStore::appendEvent(const LoggedEvent& event,
                                                          ErrorInfo* errorOut)
{
    if (event.kind.isEmpty()) {
        setError(errorOut, CoreError::ValidationError,
                 QStringLiteral("Event kind must not be empty"));
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const char* sql = R"(
        INSERT INTO event_log (kind, sender, message_id, timestamp, payload)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, "appendEvent");
        return std::nullopt;
    }

    const QDateTime ts = event.timestamp.isValid() ? event.timestamp
                                                   : QDateTime::currentDateTimeUtc();
    bindText(stmt, 1, event.kind);
    bindText(stmt, 2, event.sender);
    bindText(stmt, 3, event.messageId);
    sqlite3_bind_double(stmt, 4, toEpochSeconds(ts));
    bindText(stmt, 5, QString::fromUtf8(
        QJsonDocument(event.payload).toJson(QJsonDocument::Compact)));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail(errorOut, "appendEvent");
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(m_db));
}

std::optional<std::vector<LoggedEvent>> SQLitePreferenceStore::queryEvents(
    const EventQuery& query, ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QByteArray sql = "SELECT id, kind, sender, message_id, timestamp, payload FROM event_log";
    appendFilter(sql, query);
    sql += query.newestFirst ? " ORDER BY timestamp DESC, id DESC"
                             : " ORDER BY timestamp ASC, id ASC";
    if (query.limit > 0) {
        sql += " LIMIT ?";
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, "queryEvents");
        return std::nullopt;
    }
    const int next = bindFilter(stmt, query);
    if (query.limit > 0) {
        sqlite3_bind_int(stmt, next, query.limit);
    }

    std::vector<LoggedEvent> events;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        LoggedEvent ev;
        ev.id = sqlite3_column_int64(stmt, 0);
        ev.kind = columnText(stmt, 1);
        ev.sender = columnText(stmt, 2);
        ev.messageId = columnText(stmt, 3);
        ev.timestamp = fromEpochSeconds(sqlite3_column_double(stmt, 4));
        ev.payload = QJsonDocument::fromJson(columnText(stmt, 5).toUtf8()).object();
        events.push_back(std::move(ev));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail(errorOut, "queryEvents");
        return std::nullopt;
    }
    return events;
}

std::optional<int64_t> SQLitePreferenceStore::countEvents(const EventQuery& query,
                                                          ErrorInfo* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QByteArray sql = "SELECT count(*) FROM event_log";
    appendFilter(sql, query);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, "countEvents");
        return std::nullopt;
    }
    bindFilter(stmt, query);

    std::optional<int64_t> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    } else {
        fail(errorOut, "countEvents");
    }
    sqlite3_finalize(stmt);
    return count;
}

std::optional<int64_t> SQLitePreferenceStore::pruneEventsBefore(const QDateTime& cutoff,
                                                                ErrorInfo* errorOut)
{
    if (!cutoff.isValid()) {
        setError(errorOut, CoreError::ValidationError,
                 QStringLiteral("Prune cutoff must be a valid timestamp"));
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM event_log WHERE timestamp < ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, "pruneEventsBefore");
        return std::nullopt;
    }
    sqlite3_bind_double(stmt, 1, toEpochSeconds(cutoff));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail(errorOut, "pruneEventsBefore");
        return std::nullopt;
    }

    const int64_t removed = sqlite3_changes(m_db);
    LOG_INFO(mmStore, "Pruned %lld events older than %s",
             static_cast<long long>(removed), qUtf8Printable(cutoff.toString(Qt::ISODate)));
    return removed;
}

} // namespace mm
