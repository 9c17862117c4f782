#include "timekeeping/data/Event.hpp"

#include "timekeeping/core/WallClock.hpp"

namespace timekeeping {
namespace data {

bool CalendarEvent::isRecurring() const
{
    return rrule.has_value() && !rrule->trimmed().isEmpty();
}

bool CalendarEvent::hasZone() const
{
    return tz.has_value() && !tz->trimmed().isEmpty();
}

bool CalendarEvent::isAllDay() const
{
    if (hasZone() || !endAt) {
        return false;
    }
    const qint64 duration = *endAt - startAt;
    return core::millisOfDay(startAt) == 0 && core::millisOfDay(*endAt) == 0 && duration > 0
        && duration % core::MillisPerDay == 0;
}

qint64 CalendarEvent::wallClockDuration() const
{
    if (!endAt || *endAt < startAt) {
        return 0;
    }
    return *endAt - startAt;
}

} // namespace data
} // namespace timekeeping
