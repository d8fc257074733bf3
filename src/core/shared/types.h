#pragma once

#include <QString>

#include <optional>

namespace mm {

// Ordinal priority tier. Numeric order is significant: Low < Medium < High.
enum class Priority : int {
    Low    = 0,
    Medium = 1,
    High   = 2,
};

QString priorityToString(Priority priority);
std::optional<Priority> priorityFromString(const QString& str);

// One tier up or down, saturating at High / Low.
Priority upgradePriority(Priority priority);
Priority downgradePriority(Priority priority);

// Signed tier distance: positive when `to` ranks above `from`.
int priorityDelta(Priority from, Priority to);

// Glyph shown next to a message in list views.
QString priorityIndicator(Priority priority);

} // namespace mm
