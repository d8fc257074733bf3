#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(mmCore)
Q_DECLARE_LOGGING_CATEGORY(mmPool)
Q_DECLARE_LOGGING_CATEGORY(mmBatch)
Q_DECLARE_LOGGING_CATEGORY(mmLearning)
Q_DECLARE_LOGGING_CATEGORY(mmStore)
Q_DECLARE_LOGGING_CATEGORY(mmBackend)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
