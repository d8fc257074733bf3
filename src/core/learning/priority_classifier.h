#pragma once

#include "core/learning/priority_types.h"
#include "core/shared/errors.h"

#include <QHash>
#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace mm {

class PreferenceStore;

// PriorityClassifier -- adjusts a base Low/Medium/High classification with a
// learned per-sender importance score, and learns that score from user
// corrections.
//
// State lives in the PreferenceStore: one JSON profile per sender under
// "sender_profile/<sender>", plus "classification" and "correction" rows in
// the event log. Sender addresses are trimmed and lowercased before use.
//
// Concurrency: each sender has a slot with two mutexes. correctionMutex
// serializes recordUserOverride() for that sender; stateMutex guards the
// in-memory profile and is never held across a store write. Profile writes
// go through flush(): one caller at a time writes the latest profile, and a
// caller that finds a write in progress hands its change to that writer
// instead of waiting. Different senders never contend beyond the slot-map
// lookup.
class PriorityClassifier {
public:
    static constexpr double kHighImportanceThreshold = 0.8;
    static constexpr double kLowImportanceThreshold = 0.3;
    static constexpr double kBaseLearningRate = 0.15;
    static constexpr double kDefaultImportance = 0.5;
    static constexpr double kAccuracyTarget = 85.0;
    static constexpr double kTrendMargin = 5.0;
    static constexpr int kDefaultAccuracyDays = 30;

    static constexpr const char* kClassificationEvent = "classification";
    static constexpr const char* kCorrectionEvent = "correction";

    // `store` is not owned and must outlive the classifier.
    explicit PriorityClassifier(PreferenceStore* store);

    PriorityClassifier(const PriorityClassifier&) = delete;
    PriorityClassifier& operator=(const PriorityClassifier&) = delete;

    // Apply the sender signal to `base`. Never changes importance; bumps
    // the sender's email count and logs a classification event.
    std::optional<EnrichedPriority> classifyPriority(const ClassificationInput& input,
                                                     const BaseClassification& base,
                                                     ErrorInfo* errorOut = nullptr);

    // Log the correction and move the sender's importance toward the
    // user's choice. Returns the updated profile.
    std::optional<SenderProfile> recordUserOverride(const QString& messageId,
                                                    const QString& sender,
                                                    Priority originalPriority,
                                                    double originalConfidence,
                                                    Priority userPriority,
                                                    const QString& reason = QString(),
                                                    ErrorInfo* errorOut = nullptr);

    std::optional<AccuracyWindow> getClassificationAccuracy(int days = kDefaultAccuracyDays,
                                                            ErrorInfo* errorOut = nullptr);

    bool setSenderVip(const QString& sender, bool vip, ErrorInfo* errorOut = nullptr);

    // nullopt when the sender has no stored profile (errorOut untouched)
    // or on storage failure.
    std::optional<SenderProfile> getSenderStats(const QString& sender,
                                                ErrorInfo* errorOut = nullptr);

    // Newest first.
    std::optional<std::vector<CorrectionEvent>> recentCorrections(const QString& sender,
                                                                  int days = kDefaultAccuracyDays,
                                                                  int limit = 50,
                                                                  ErrorInfo* errorOut = nullptr);

    // Drop classification/correction events older than retentionDays.
    // Profiles are kept.
    std::optional<int64_t> pruneHistory(int retentionDays, ErrorInfo* errorOut = nullptr);

    static QString normalizeSender(const QString& sender);
    static QString profileKey(const QString& senderKey);

    // importance after one correction in `direction` (-1, 0, +1).
    static double adjustedImportance(double importance, int correctionCount, int direction);

private:
    struct SenderSlot {
        std::mutex correctionMutex;
        std::mutex stateMutex;

        // Guarded by stateMutex.
        bool loaded = false;
        std::optional<SenderProfile> profile;   // nullopt until first touched
        uint64_t version = 0;
        uint64_t persistedVersion = 0;
        bool writerActive = false;
    };

    std::shared_ptr<SenderSlot> slotFor(const QString& senderKey);

    // Caller holds slot.stateMutex.
    bool ensureLoaded(SenderSlot& slot, const QString& senderKey, ErrorInfo* errorOut);
    bool persist(const SenderProfile& profile, ErrorInfo* errorOut);
    // Caller holds no slot lock. Returns once the slot's latest profile is
    // stored, or once another caller has taken over writing it.
    bool flush(SenderSlot& slot, ErrorInfo* errorOut);

    PreferenceStore* m_store = nullptr;

    std::mutex m_slotsMutex;
    QHash<QString, std::shared_ptr<SenderSlot>> m_slots;
};

} // namespace mm
