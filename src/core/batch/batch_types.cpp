#include "core/batch/batch_types.h"

#include <QJsonArray>

namespace mm {

QString itemStatusToString(ItemResult::Status status)
{
    switch (status) {
    case ItemResult::Status::Success:   return QStringLiteral("success");
    case ItemResult::Status::Error:     return QStringLiteral("error");
    case ItemResult::Status::Timeout:   return QStringLiteral("timeout");
    case ItemResult::Status::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("error");
}

ItemResult ItemResult::success(const QString& itemId, QJsonObject payload, int durationMs)
{
    ItemResult r;
    r.status = Status::Success;
    r.itemId = itemId;
    r.payload = std::move(payload);
    r.durationMs = durationMs;
    return r;
}

ItemResult ItemResult::failure(const QString& itemId, const QString& error, int durationMs)
{
    ItemResult r;
    r.status = Status::Error;
    r.itemId = itemId;
    r.error = error;
    r.durationMs = durationMs;
    return r;
}

ItemResult ItemResult::timedOut(const QString& itemId, int timeoutMs)
{
    ItemResult r;
    r.status = Status::Timeout;
    r.itemId = itemId;
    r.error = QStringLiteral("Processing exceeded %1 ms").arg(timeoutMs);
    r.durationMs = timeoutMs;
    return r;
}

ItemResult ItemResult::cancelled(const QString& itemId)
{
    ItemResult r;
    r.status = Status::Cancelled;
    r.itemId = itemId;
    r.error = QStringLiteral("Cancelled before processing");
    return r;
}

QJsonObject ItemResult::toJson() const
{
    if (status == Status::Success) {
        return payload;
    }
    QJsonObject obj;
    obj[QStringLiteral("error")] = error;
    obj[QStringLiteral("timeout")] = status == Status::Timeout;
    obj[QStringLiteral("item_id")] = itemId;
    if (status == Status::Cancelled) {
        obj[QStringLiteral("cancelled")] = true;
    }
    return obj;
}

QJsonObject BatchResult::toJson() const
{
    QJsonArray items;
    for (const ItemResult& r : results) {
        items.append(r.toJson());
    }

    QJsonObject obj;
    obj[QStringLiteral("total")] = total;
    obj[QStringLiteral("success")] = success;
    obj[QStringLiteral("failed")] = failed;
    obj[QStringLiteral("results")] = items;
    obj[QStringLiteral("elapsed_seconds")] = elapsedSeconds;
    obj[QStringLiteral("items_per_minute")] = itemsPerMinute;
    return obj;
}

} // namespace mm
