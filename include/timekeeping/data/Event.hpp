#pragma once

#include <QString>
#include <optional>

namespace timekeeping {
namespace data {

struct Household
{
    QString id;
    std::optional<QString> tz;
};

// Canonical event as the engine sees it. startAt/endAt are wall-clock
// milliseconds in the event's effective zone; the *Utc fields cache the
// first occurrence and may be stale.
struct CalendarEvent
{
    QString id;
    QString householdId;
    QString title;
    qint64 startAt = 0;
    std::optional<qint64> endAt;
    std::optional<QString> tz;
    std::optional<QString> rrule;
    std::optional<QString> exdates;
    std::optional<qint64> startAtUtc;
    std::optional<qint64> endAtUtc;
    std::optional<qint64> reminder;

    bool isRecurring() const;
    bool hasZone() const;
    // No zone, both ends on local midnight, positive whole-day duration.
    bool isAllDay() const;
    qint64 wallClockDuration() const;
};

} // namespace data
} // namespace timekeeping
