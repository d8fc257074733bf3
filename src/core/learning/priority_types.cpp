#include "core/learning/priority_types.h"

#include <algorithm>
#include <initializer_list>

namespace mm {

QJsonObject EnrichedPriority::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("priority")] = priorityToString(priority);
    obj[QStringLiteral("base_priority")] = priorityToString(basePriority);
    obj[QStringLiteral("confidence")] = confidence;
    obj[QStringLiteral("sender_importance")] = senderImportance;
    obj[QStringLiteral("is_vip")] = vip;
    obj[QStringLiteral("adjustment")] = adjustment;
    obj[QStringLiteral("visual_indicator")] = visualIndicator;
    obj[QStringLiteral("source")] = source;
    return obj;
}

// ── SenderProfile ───────────────────────────────────────────

QJsonObject SenderProfile::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("sender")] = senderKey;
    obj[QStringLiteral("importance")] = importance;
    obj[QStringLiteral("correction_count")] = correctionCount;
    obj[QStringLiteral("email_count")] = emailCount;
    obj[QStringLiteral("is_vip")] = vip;
    if (lastUpdated.isValid()) {
        obj[QStringLiteral("last_updated")] = lastUpdated.toString(Qt::ISODateWithMs);
    }
    return obj;
}

std::optional<SenderProfile> SenderProfile::fromJson(const QJsonObject& obj)
{
    const QString sender = obj.value(QStringLiteral("sender")).toString();
    if (sender.isEmpty()) {
        return std::nullopt;
    }

    SenderProfile profile;
    profile.senderKey = sender;
    profile.importance = qBound(0.0, obj.value(QStringLiteral("importance")).toDouble(0.5), 1.0);
    profile.correctionCount = std::max(0, obj.value(QStringLiteral("correction_count")).toInt());
    profile.emailCount = std::max(0, obj.value(QStringLiteral("email_count")).toInt());
    profile.vip = obj.value(QStringLiteral("is_vip")).toBool(false);
    profile.lastUpdated = QDateTime::fromString(
        obj.value(QStringLiteral("last_updated")).toString(), Qt::ISODateWithMs);
    return profile;
}

// ── Corrections ─────────────────────────────────────────────

QString correctionTypeToString(CorrectionType type)
{
    switch (type) {
    case CorrectionType::PriorityOverride:    return QStringLiteral("priority_override");
    case CorrectionType::SenderImportance:    return QStringLiteral("sender_importance");
    case CorrectionType::UrgencyMisdetection: return QStringLiteral("urgency_misdetection");
    case CorrectionType::CategoryAdjustment:  return QStringLiteral("category_adjustment");
    }
    return QStringLiteral("priority_override");
}

CorrectionType correctionTypeFromString(const QString& str)
{
    if (str == QLatin1String("sender_importance"))    return CorrectionType::SenderImportance;
    if (str == QLatin1String("urgency_misdetection")) return CorrectionType::UrgencyMisdetection;
    if (str == QLatin1String("category_adjustment"))  return CorrectionType::CategoryAdjustment;
    return CorrectionType::PriorityOverride;
}

CorrectionType correctionTypeForReason(const QString& reason)
{
    const QString lower = reason.toLower();
    if (lower.isEmpty()) {
        return CorrectionType::PriorityOverride;
    }

    const auto containsAny = [&lower](std::initializer_list<const char*> words) {
        for (const char* w : words) {
            if (lower.contains(QLatin1String(w))) {
                return true;
            }
        }
        return false;
    };

    // First match wins, in this order.
    if (containsAny({"sender", "vip", "importance"})) {
        return CorrectionType::SenderImportance;
    }
    if (containsAny({"urgent", "deadline", "misdetect"})) {
        return CorrectionType::UrgencyMisdetection;
    }
    if (containsAny({"category", "newsletter", "incorrect"})) {
        return CorrectionType::CategoryAdjustment;
    }
    return CorrectionType::PriorityOverride;
}

QJsonObject CorrectionEvent::payload() const
{
    QJsonObject obj;
    obj[QStringLiteral("original_priority")] = priorityToString(originalPriority);
    obj[QStringLiteral("original_confidence")] = originalConfidence;
    obj[QStringLiteral("user_priority")] = priorityToString(userPriority);
    obj[QStringLiteral("reason")] = reason;
    obj[QStringLiteral("correction_type")] = correctionTypeToString(correctionType);
    return obj;
}

CorrectionEvent CorrectionEvent::fromPayload(const QString& messageId,
                                             const QString& sender,
                                             const QDateTime& timestamp,
                                             const QJsonObject& payload)
{
    CorrectionEvent ev;
    ev.messageId = messageId;
    ev.sender = sender;
    ev.timestamp = timestamp;
    ev.originalPriority = priorityFromString(
        payload.value(QStringLiteral("original_priority")).toString()).value_or(Priority::Medium);
    ev.originalConfidence = payload.value(QStringLiteral("original_confidence")).toDouble();
    ev.userPriority = priorityFromString(
        payload.value(QStringLiteral("user_priority")).toString()).value_or(Priority::Medium);
    ev.reason = payload.value(QStringLiteral("reason")).toString();
    ev.correctionType = correctionTypeFromString(
        payload.value(QStringLiteral("correction_type")).toString());
    return ev;
}

// ── Accuracy ────────────────────────────────────────────────

QString accuracyTrendToString(AccuracyTrend trend)
{
    switch (trend) {
    case AccuracyTrend::Improving:        return QStringLiteral("improving");
    case AccuracyTrend::Declining:        return QStringLiteral("declining");
    case AccuracyTrend::Stable:           return QStringLiteral("stable");
    case AccuracyTrend::InsufficientData: return QStringLiteral("insufficient_data");
    }
    return QStringLiteral("insufficient_data");
}

QJsonObject AccuracyWindow::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("period_days")] = periodDays;
    obj[QStringLiteral("total_classified")] = static_cast<qint64>(totalClassified);
    obj[QStringLiteral("total_corrected")] = static_cast<qint64>(totalCorrected);
    obj[QStringLiteral("accuracy_percentage")] = accuracyPercentage;
    obj[QStringLiteral("target_met")] = targetMet;
    obj[QStringLiteral("trend")] = accuracyTrendToString(trend);
    return obj;
}

} // namespace mm
