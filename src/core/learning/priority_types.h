#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace mm {

// Message fields the classifier looks at.
struct ClassificationInput {
    QString messageId;
    QString sender;
    QString subject;
};

// Output of the upstream (model-based) classifier.
struct BaseClassification {
    Priority priority = Priority::Medium;
    double confidence = 0.0;
};

// Base classification enriched with the learned sender signal.
struct EnrichedPriority {
    Priority priority = Priority::Medium;
    Priority basePriority = Priority::Medium;
    double confidence = 0.0;
    double senderImportance = 0.5;
    bool vip = false;
    int adjustment = 0;              // signed tier change applied to basePriority
    QString visualIndicator;
    QString source = QStringLiteral("enhanced_learning");

    QJsonObject toJson() const;
};

// Learned per-sender state. Persisted as a JSON document.
struct SenderProfile {
    QString senderKey;
    double importance = 0.5;         // [0, 1]
    int correctionCount = 0;
    int emailCount = 0;
    bool vip = false;
    QDateTime lastUpdated;

    QJsonObject toJson() const;
    static std::optional<SenderProfile> fromJson(const QJsonObject& obj);
};

enum class CorrectionType : uint8_t {
    PriorityOverride,
    SenderImportance,
    UrgencyMisdetection,
    CategoryAdjustment,
};

QString correctionTypeToString(CorrectionType type);
CorrectionType correctionTypeFromString(const QString& str);

// Keyword match on the free-text reason; PriorityOverride when nothing matches.
CorrectionType correctionTypeForReason(const QString& reason);

struct CorrectionEvent {
    QString messageId;
    QString sender;
    Priority originalPriority = Priority::Medium;
    double originalConfidence = 0.0;
    Priority userPriority = Priority::Medium;
    QString reason;
    CorrectionType correctionType = CorrectionType::PriorityOverride;
    QDateTime timestamp;

    // Event-log payload; sender, messageId and timestamp live in the row.
    QJsonObject payload() const;
    static CorrectionEvent fromPayload(const QString& messageId,
                                       const QString& sender,
                                       const QDateTime& timestamp,
                                       const QJsonObject& payload);
};

enum class AccuracyTrend : uint8_t {
    Improving,
    Declining,
    Stable,
    InsufficientData,
};

QString accuracyTrendToString(AccuracyTrend trend);

struct AccuracyWindow {
    int periodDays = 0;
    int64_t totalClassified = 0;
    int64_t totalCorrected = 0;
    double accuracyPercentage = 0.0;
    bool targetMet = false;
    AccuracyTrend trend = AccuracyTrend::InsufficientData;

    QJsonObject toJson() const;
};

} // namespace mm
