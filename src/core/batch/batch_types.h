#pragma once

#include <QJsonObject>
#include <QString>

#include <vector>

namespace mm {

// One unit of batch work. payload is the prompt (or a reference the
// processor understands).
struct WorkItem {
    QString id;
    QString payload;
};

// Outcome of a single WorkItem. Exactly one per input item.
struct ItemResult {
    enum class Status {
        Success,
        Error,
        Timeout,
        Cancelled,
    };

    Status status = Status::Error;
    QString itemId;
    QJsonObject payload;     // Success only
    QString error;           // non-Success only
    int durationMs = 0;

    bool ok() const { return status == Status::Success; }

    // Success: the processor payload. Otherwise {error, timeout, item_id}.
    QJsonObject toJson() const;

    static ItemResult success(const QString& itemId, QJsonObject payload, int durationMs);
    static ItemResult failure(const QString& itemId, const QString& error, int durationMs);
    static ItemResult timedOut(const QString& itemId, int timeoutMs);
    static ItemResult cancelled(const QString& itemId);
};

QString itemStatusToString(ItemResult::Status status);

// Aggregate of one processBatch() call.
// total == success + failed == results.size(); results[i] belongs to items[i].
struct BatchResult {
    int total = 0;
    int success = 0;
    int failed = 0;
    std::vector<ItemResult> results;
    double elapsedSeconds = 0.0;
    double itemsPerMinute = 0.0;

    QJsonObject toJson() const;
};

} // namespace mm
