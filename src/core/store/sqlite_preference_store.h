#pragma once

#include "core/store/preference_store.h"

#include <QString>

#include <memory>
#include <mutex>

#include <sqlite3.h>

namespace mm {

// SQLitePreferenceStore -- PreferenceStore over a single sqlite3 connection.
//
// All statements run under m_mutex, so one instance may be shared by the
// dispatcher workers and the classifier. Pass ":memory:" for a private
// in-memory database.
class SQLitePreferenceStore final : public PreferenceStore {
public:
    ~SQLitePreferenceStore() override;

    SQLitePreferenceStore(const SQLitePreferenceStore&) = delete;
    SQLitePreferenceStore& operator=(const SQLitePreferenceStore&) = delete;

    // Open or create the database. Creates schema and sets pragmas on
    // first open.
    static std::unique_ptr<SQLitePreferenceStore> open(const QString& dbPath,
                                                       QString* errorOut = nullptr);

    std::optional<QString> getPreference(const QString& key,
                                         ErrorInfo* errorOut = nullptr) override;
    bool setPreference(const QString& key, const QString& value,
                       ErrorInfo* errorOut = nullptr) override;

    std::optional<int64_t> appendEvent(const LoggedEvent& event,
                                       ErrorInfo* errorOut = nullptr) override;
    std::optional<std::vector<LoggedEvent>> queryEvents(const EventQuery& query,
                                                        ErrorInfo* errorOut = nullptr) override;
    std::optional<int64_t> countEvents(const EventQuery& query,
                                       ErrorInfo* errorOut = nullptr) override;
    std::optional<int64_t> pruneEventsBefore(const QDateTime& cutoff,
                                             ErrorInfo* errorOut = nullptr) override;

private:
    SQLitePreferenceStore() = default;

    bool init(const QString& dbPath, QString* errorOut);
    bool execSql(const char* sql);
    bool fail(ErrorInfo* errorOut, const char* operation);

    sqlite3* m_db = nullptr;
    std::mutex m_mutex;
};

} // namespace mm
