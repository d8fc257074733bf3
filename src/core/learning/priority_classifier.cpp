#include "core/learning/priority_classifier.h"
#include "core/store/preference_store.h"
#include "core/shared/logging.h"

#include <QJsonDocument>

#include <algorithm>

namespace mm {

PriorityClassifier::PriorityClassifier(PreferenceStore* store)
    : m_store(store)
{
}

QString PriorityClassifier::normalizeSender(const QString& sender)
{
    return sender.trimmed().toLower();
}

QString PriorityClassifier::profileKey(const QString& senderKey)
{
    return QStringLiteral("sender_profile/") + senderKey;
}

double PriorityClassifier::adjustedImportance(double importance, int correctionCount, int direction)
{
    if (direction == 0) {
        return importance;
    }
    const double step = kBaseLearningRate / (1.0 + std::max(0, correctionCount));
    return std::clamp(importance + (direction > 0 ? step : -step), 0.0, 1.0);
}

std::shared_ptr<PriorityClassifier::SenderSlot> PriorityClassifier::slotFor(const QString& senderKey)
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    auto it = m_slots.find(senderKey);
    if (it == m_slots.end()) {
        it = m_slots.insert(senderKey, std::make_shared<SenderSlot>());
    }
    return it.value();
}

bool PriorityClassifier::ensureLoaded(SenderSlot& slot, const QString& senderKey,
                                      ErrorInfo* errorOut)
{
    if (slot.loaded) {
        return true;
    }

    ErrorInfo storeError;
    const std::optional<QString> stored = m_store->getPreference(profileKey(senderKey), &storeError);
    if (storeError.code != CoreError::None) {
        return setError(errorOut, storeError.code, storeError.message);
    }

    if (stored.has_value()) {
        const QJsonObject obj = QJsonDocument::fromJson(stored->toUtf8()).object();
        slot.profile = SenderProfile::fromJson(obj);
        if (!slot.profile) {
            // Unreadable row: start over from defaults rather than failing
            // every classification for this sender.
            LOG_WARN(mmLearning, "Discarding malformed profile for %s",
                     qUtf8Printable(senderKey));
        }
    }
    slot.loaded = true;
    return true;
}

bool PriorityClassifier::persist(const SenderProfile& profile, ErrorInfo* errorOut)
{
    const QString json = QString::fromUtf8(
        QJsonDocument(profile.toJson()).toJson(QJsonDocument::Compact));
    return m_store->setPreference(profileKey(profile.senderKey), json, errorOut);
}

bool PriorityClassifier::flush(SenderSlot& slot, ErrorInfo* errorOut)
{
    {
        std::lock_guard<std::mutex> lock(slot.stateMutex);
        if (slot.writerActive) {
            return true;
        }
        slot.writerActive = true;
    }

    while (true) {
        SenderProfile snapshot;
        uint64_t version = 0;
        {
            std::lock_guard<std::mutex> lock(slot.stateMutex);
            if (!slot.profile || slot.version == slot.persistedVersion) {
                slot.writerActive = false;
                return true;
            }
            snapshot = *slot.profile;
            version = slot.version;
        }

        const bool ok = persist(snapshot, errorOut);

        std::lock_guard<std::mutex> lock(slot.stateMutex);
        if (!ok) {
            slot.writerActive = false;
            return false;
        }
        slot.persistedVersion = version;
    }
}

// ── Classification ──────────────────────────────────────────

std::optional<EnrichedPriority> PriorityClassifier::classifyPriority(
    const ClassificationInput& input, const BaseClassification& base, ErrorInfo* errorOut)
{
    const QString senderKey = normalizeSender(input.sender);
    if (senderKey.isEmpty()) {
        setError(errorOut, CoreError::ValidationError, QStringLiteral("Sender must not be empty"));
        return std::nullopt;
    }

    std::shared_ptr<SenderSlot> slot = slotFor(senderKey);

    EnrichedPriority result;
    result.basePriority = base.priority;
    result.confidence = base.confidence;
    {
        std::lock_guard<std::mutex> lock(slot->stateMutex);
        if (!ensureLoaded(*slot, senderKey, errorOut)) {
            return std::nullopt;
        }

        SenderProfile profile;
        if (slot->profile) {
            profile = *slot->profile;
        } else {
            profile.senderKey = senderKey;
            profile.importance = kDefaultImportance;
        }

        Priority adjusted = base.priority;
        if (profile.vip || profile.importance > kHighImportanceThreshold) {
            adjusted = upgradePriority(base.priority);
        } else if (profile.importance < kLowImportanceThreshold) {
            adjusted = downgradePriority(base.priority);
        }

        result.priority = adjusted;
        result.senderImportance = profile.importance;
        result.vip = profile.vip;
        result.adjustment = priorityDelta(base.priority, adjusted);

        profile.emailCount += 1;
        profile.lastUpdated = QDateTime::currentDateTimeUtc();
        slot->profile = profile;
        ++slot->version;
    }
    if (!flush(*slot, errorOut)) {
        return std::nullopt;
    }
    result.visualIndicator = priorityIndicator(result.priority);

    LoggedEvent event;
    event.kind = QString::fromLatin1(kClassificationEvent);
    event.sender = senderKey;
    event.messageId = input.messageId;
    event.timestamp = QDateTime::currentDateTimeUtc();
    event.payload[QStringLiteral("base_priority")] = priorityToString(result.basePriority);
    event.payload[QStringLiteral("priority")] = priorityToString(result.priority);
    event.payload[QStringLiteral("confidence")] = result.confidence;
    if (!m_store->appendEvent(event, errorOut)) {
        return std::nullopt;
    }

    if (result.adjustment != 0) {
        LOG_DEBUG(mmLearning, "%s: %s -> %s (importance=%.3f vip=%d)",
                  qUtf8Printable(senderKey),
                  qUtf8Printable(priorityToString(result.basePriority)),
                  qUtf8Printable(priorityToString(result.priority)),
                  result.senderImportance, result.vip ? 1 : 0);
    }
    return result;
}

// ── Corrections ─────────────────────────────────────────────

std::optional<SenderProfile> PriorityClassifier::recordUserOverride(
    const QString& messageId, const QString& sender, Priority originalPriority,
    double originalConfidence, Priority userPriority, const QString& reason,
    ErrorInfo* errorOut)
{
    const QString senderKey = normalizeSender(sender);
    if (messageId.trimmed().isEmpty()) {
        setError(errorOut, CoreError::ValidationError, QStringLiteral("Message id must not be empty"));
        return std::nullopt;
    }
    if (senderKey.isEmpty()) {
        setError(errorOut, CoreError::ValidationError, QStringLiteral("Sender must not be empty"));
        return std::nullopt;
    }
    if (!(originalConfidence >= 0.0 && originalConfidence <= 1.0)) {
        setError(errorOut, CoreError::ValidationError,
                 QStringLiteral("Confidence must be within [0, 1], got %1").arg(originalConfidence));
        return std::nullopt;
    }

    std::shared_ptr<SenderSlot> slot = slotFor(senderKey);
    std::lock_guard<std::mutex> correctionLock(slot->correctionMutex);

    CorrectionEvent correction;
    correction.messageId = messageId;
    correction.sender = senderKey;
    correction.originalPriority = originalPriority;
    correction.originalConfidence = originalConfidence;
    correction.userPriority = userPriority;
    correction.reason = reason;
    correction.correctionType = correctionTypeForReason(reason);
    correction.timestamp = QDateTime::currentDateTimeUtc();

    LoggedEvent event;
    event.kind = QString::fromLatin1(kCorrectionEvent);
    event.sender = senderKey;
    event.messageId = messageId;
    event.timestamp = correction.timestamp;
    event.payload = correction.payload();
    if (!m_store->appendEvent(event, errorOut)) {
        return std::nullopt;
    }

    const int delta = priorityDelta(originalPriority, userPriority);
    const int direction = delta > 0 ? 1 : (delta < 0 ? -1 : 0);

    SenderProfile profile;
    {
        std::lock_guard<std::mutex> stateLock(slot->stateMutex);
        if (!ensureLoaded(*slot, senderKey, errorOut)) {
            return std::nullopt;
        }

        if (slot->profile) {
            profile = *slot->profile;
        } else {
            profile.senderKey = senderKey;
            profile.importance = kDefaultImportance;
        }

        // Same-tier corrections still count; only the importance nudge needs a direction.
        const double before = profile.importance;
        profile.importance = adjustedImportance(profile.importance, profile.correctionCount, direction);
        profile.correctionCount += 1;
        profile.lastUpdated = correction.timestamp;
        slot->profile = profile;
        ++slot->version;

        LOG_INFO(mmLearning, "Sender %s importance %.4f -> %.4f (%s, corrections=%d)",
                 qUtf8Printable(senderKey), before, profile.importance,
                 qUtf8Printable(correctionTypeToString(correction.correctionType)),
                 profile.correctionCount);
    }

    if (!flush(*slot, errorOut)) {
        return std::nullopt;
    }
    return profile;
}

// ── Accuracy ────────────────────────────────────────────────

std::optional<AccuracyWindow> PriorityClassifier::getClassificationAccuracy(int days,
                                                                            ErrorInfo* errorOut)
{
    const int period = std::max(1, days);
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const QDateTime from = now.addDays(-period);
    const QDateTime mid = from.addMSecs(from.msecsTo(now) / 2);

    const auto count = [this, errorOut](const char* kind, const QDateTime& lo, const QDateTime& hi)
        -> std::optional<int64_t> {
        EventQuery query;
        query.kind = QString::fromLatin1(kind);
        query.from = lo;
        query.to = hi;
        return m_store->countEvents(query, errorOut);
    };

    const auto accuracyOf = [](int64_t classified, int64_t corrected) {
        if (classified <= 0) {
            return 0.0;
        }
        const int64_t correct = std::max<int64_t>(0, classified - corrected);
        return static_cast<double>(correct) / static_cast<double>(classified) * 100.0;
    };

    // Upper bounds stay open so events stamped during this call still count.
    const auto classified = count(kClassificationEvent, from, QDateTime());
    const auto corrected = count(kCorrectionEvent, from, QDateTime());
    const auto firstClassified = count(kClassificationEvent, from, mid);
    const auto firstCorrected = count(kCorrectionEvent, from, mid);
    if (!classified || !corrected || !firstClassified || !firstCorrected) {
        return std::nullopt;
    }

    AccuracyWindow window;
    window.periodDays = period;
    window.totalClassified = *classified;
    window.totalCorrected = *corrected;
    window.accuracyPercentage = accuracyOf(*classified, *corrected);
    window.targetMet = window.accuracyPercentage >= kAccuracyTarget;

    const int64_t secondClassified = *classified - *firstClassified;
    const int64_t secondCorrected = *corrected - *firstCorrected;
    if (*firstClassified == 0 || secondClassified == 0) {
        window.trend = AccuracyTrend::InsufficientData;
    } else {
        const double diff = accuracyOf(secondClassified, secondCorrected)
            - accuracyOf(*firstClassified, *firstCorrected);
        if (diff > kTrendMargin) {
            window.trend = AccuracyTrend::Improving;
        } else if (diff < -kTrendMargin) {
            window.trend = AccuracyTrend::Declining;
        } else {
            window.trend = AccuracyTrend::Stable;
        }
    }
    return window;
}

// ── Sender management ───────────────────────────────────────

bool PriorityClassifier::setSenderVip(const QString& sender, bool vip, ErrorInfo* errorOut)
{
    const QString senderKey = normalizeSender(sender);
    if (senderKey.isEmpty()) {
        return setError(errorOut, CoreError::ValidationError,
                        QStringLiteral("Sender must not be empty"));
    }

    std::shared_ptr<SenderSlot> slot = slotFor(senderKey);
    {
        std::lock_guard<std::mutex> lock(slot->stateMutex);
        if (!ensureLoaded(*slot, senderKey, errorOut)) {
            return false;
        }

        SenderProfile profile;
        if (slot->profile) {
            profile = *slot->profile;
        } else {
            profile.senderKey = senderKey;
            profile.importance = kDefaultImportance;
        }
        profile.vip = vip;
        profile.lastUpdated = QDateTime::currentDateTimeUtc();
        slot->profile = profile;
        ++slot->version;
    }

    if (!flush(*slot, errorOut)) {
        return false;
    }
    LOG_INFO(mmLearning, "VIP status for %s set to %d", qUtf8Printable(senderKey), vip ? 1 : 0);
    return true;
}

std::optional<SenderProfile> PriorityClassifier::getSenderStats(const QString& sender,
                                                                ErrorInfo* errorOut)
{
    const QString senderKey = normalizeSender(sender);
    if (senderKey.isEmpty()) {
        setError(errorOut, CoreError::ValidationError, QStringLiteral("Sender must not be empty"));
        return std::nullopt;
    }

    std::shared_ptr<SenderSlot> slot = slotFor(senderKey);
    std::lock_guard<std::mutex> lock(slot->stateMutex);
    if (!ensureLoaded(*slot, senderKey, errorOut)) {
        return std::nullopt;
    }
    return slot->profile;
}

std::optional<std::vector<CorrectionEvent>> PriorityClassifier::recentCorrections(
    const QString& sender, int days, int limit, ErrorInfo* errorOut)
{
    const QString senderKey = normalizeSender(sender);
    if (senderKey.isEmpty()) {
        setError(errorOut, CoreError::ValidationError, QStringLiteral("Sender must not be empty"));
        return std::nullopt;
    }

    EventQuery query;
    query.kind = QString::fromLatin1(kCorrectionEvent);
    query.sender = senderKey;
    query.from = QDateTime::currentDateTimeUtc().addDays(-std::max(1, days));
    query.limit = limit;
    query.newestFirst = true;

    const auto events = m_store->queryEvents(query, errorOut);
    if (!events) {
        return std::nullopt;
    }

    std::vector<CorrectionEvent> corrections;
    corrections.reserve(events->size());
    for (const LoggedEvent& ev : *events) {
        corrections.push_back(
            CorrectionEvent::fromPayload(ev.messageId, ev.sender, ev.timestamp, ev.payload));
    }
    return corrections;
}

std::optional<int64_t> PriorityClassifier::pruneHistory(int retentionDays, ErrorInfo* errorOut)
{
    if (retentionDays < 1) {
        setError(errorOut, CoreError::ValidationError,
                 QStringLiteral("Retention must be at least one day, got %1").arg(retentionDays));
        return std::nullopt;
    }
    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addDays(-retentionDays);
    return m_store->pruneEventsBefore(cutoff, errorOut);
}

} // namespace mm
