#include "core/shared/types.h"

namespace mm {

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::Low:    return QStringLiteral("Low");
    case Priority::Medium: return QStringLiteral("Medium");
    case Priority::High:   return QStringLiteral("High");
    }
    return QStringLiteral("Medium");
}

std::optional<Priority> priorityFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("low"))    return Priority::Low;
    if (normalized == QLatin1String("medium")) return Priority::Medium;
    if (normalized == QLatin1String("high"))   return Priority::High;
    return std::nullopt;
}

Priority upgradePriority(Priority priority)
{
    switch (priority) {
    case Priority::Low:    return Priority::Medium;
    case Priority::Medium: return Priority::High;
    case Priority::High:   return Priority::High;
    }
    return priority;
}

Priority downgradePriority(Priority priority)
{
    switch (priority) {
    case Priority::High:   return Priority::Medium;
    case Priority::Medium: return Priority::Low;
    case Priority::Low:    return Priority::Low;
    }
    return priority;
}

int priorityDelta(Priority from, Priority to)
{
    return static_cast<int>(to) - static_cast<int>(from);
}

QString priorityIndicator(Priority priority)
{
    switch (priority) {
    case Priority::High:   return QStringLiteral("\U0001F534");
    case Priority::Medium: return QStringLiteral("\U0001F7E1");
    case Priority::Low:    return QStringLiteral("\U0001F535");
    }
    return QStringLiteral("\u26AA");
}

} // namespace mm
