#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

#include "timekeeping/data/Event.hpp"
#include "timekeeping/data/StoredTimestamp.hpp"

namespace timekeeping {
namespace data {

// Storage row. Field names in JSON are the schema contract:
// id, household_id, title, start_at, end_at, tz, rrule, exdates,
// start_at_utc, end_at_utc, reminder.
struct EventRecord
{
    QString id;
    QString householdId;
    QString title;
    StoredTimestamp startAt;
    StoredTimestamp endAt;
    std::optional<QString> tz;
    std::optional<QString> rrule;
    std::optional<QString> exdates;
    StoredTimestamp startAtUtc;
    StoredTimestamp endAtUtc;
    StoredTimestamp reminder;

    /// Empty unless every temporal column already uses the canonical encoding.
    std::optional<CalendarEvent> toCanonical() const;
    static EventRecord fromCanonical(const CalendarEvent &event);

    static EventRecord fromJson(const QJsonObject &object);
    QJsonObject toJson() const;

    bool operator==(const EventRecord &other) const;
    bool operator!=(const EventRecord &other) const { return !(*this == other); }
};

} // namespace data
} // namespace timekeeping
