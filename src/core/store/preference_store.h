#pragma once

#include "core/shared/errors.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace mm {

// One append-only row of the event log.
struct LoggedEvent {
    int64_t id = 0;          // assigned by the store
    QString kind;            // "classification", "correction", ...
    QString sender;
    QString messageId;
    QDateTime timestamp;
    QJsonObject payload;
};

// Filter for queryEvents()/countEvents(). An invalid QDateTime leaves that
// side of the range open; limit <= 0 means no limit.
struct EventQuery {
    QString kind;
    std::optional<QString> sender;
    QDateTime from;          // inclusive
    QDateTime to;            // exclusive
    int limit = 0;
    bool newestFirst = false;
};

// PreferenceStore -- durable key/value preferences plus an append-only
// event log. Implementations must be safe to call from multiple threads.
//
// Failures are reported as CoreError::StorageFailure via errorOut.
class PreferenceStore {
public:
    virtual ~PreferenceStore() = default;

    // nullopt when the key is absent (errorOut untouched) or on failure
    // (errorOut->code == StorageFailure).
    virtual std::optional<QString> getPreference(const QString& key,
                                                 ErrorInfo* errorOut = nullptr) = 0;
    virtual bool setPreference(const QString& key, const QString& value,
                               ErrorInfo* errorOut = nullptr) = 0;

    // Returns the new row id.
    virtual std::optional<int64_t> appendEvent(const LoggedEvent& event,
                                               ErrorInfo* errorOut = nullptr) = 0;
    virtual std::optional<std::vector<LoggedEvent>> queryEvents(const EventQuery& query,
                                                                ErrorInfo* errorOut = nullptr) = 0;
    virtual std::optional<int64_t> countEvents(const EventQuery& query,
                                               ErrorInfo* errorOut = nullptr) = 0;

    // Delete events strictly older than cutoff. Returns rows removed.
    virtual std::optional<int64_t> pruneEventsBefore(const QDateTime& cutoff,
                                                     ErrorInfo* errorOut = nullptr) = 0;
};

} // namespace mm
