#include "timekeeping/data/EventRecord.hpp"

#include <QJsonValue>

namespace timekeeping {
namespace data {

namespace {
constexpr auto IdKey = "id";
constexpr auto HouseholdKey = "household_id";
constexpr auto TitleKey = "title";
constexpr auto StartKey = "start_at";
constexpr auto EndKey = "end_at";
constexpr auto TzKey = "tz";
constexpr auto RruleKey = "rrule";
constexpr auto ExdatesKey = "exdates";
constexpr auto StartUtcKey = "start_at_utc";
constexpr auto EndUtcKey = "end_at_utc";
constexpr auto ReminderKey = "reminder";

std::optional<QString> optionalText(const QJsonObject &object, const char *key)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

void putOptionalText(QJsonObject &object, const char *key, const std::optional<QString> &text)
{
    if (text) {
        object.insert(QLatin1String(key), *text);
    }
}

void putTimestamp(QJsonObject &object, const char *key, const StoredTimestamp &timestamp)
{
    if (!timestamp.isMissing()) {
        object.insert(QLatin1String(key), timestamp.toJson());
    }
}

// Caches and reminders were always written in milliseconds, so they are read
// without the seconds heuristic that applies to the wall-clock columns.
StoredTimestamp cacheFromJson(const QJsonValue &value)
{
    if (value.isDouble()) {
        return StoredTimestamp::millis(static_cast<qint64>(value.toDouble()));
    }
    return StoredTimestamp::fromJson(value);
}
} // namespace

std::optional<CalendarEvent> EventRecord::toCanonical() const
{
    const auto start = startAt.canonicalMillis();
    if (!start || !endAt.isCanonical() || !startAtUtc.isCanonical() || !endAtUtc.isCanonical()
        || !reminder.isCanonical()) {
        return std::nullopt;
    }
    CalendarEvent event;
    event.id = id;
    event.householdId = householdId;
    event.title = title;
    event.startAt = *start;
    event.endAt = endAt.canonicalMillis();
    event.tz = tz;
    event.rrule = rrule;
    event.exdates = exdates;
    event.startAtUtc = startAtUtc.canonicalMillis();
    event.endAtUtc = endAtUtc.canonicalMillis();
    event.reminder = reminder.canonicalMillis();
    return event;
}

EventRecord EventRecord::fromCanonical(const CalendarEvent &event)
{
    EventRecord record;
    record.id = event.id;
    record.householdId = event.householdId;
    record.title = event.title;
    record.startAt = StoredTimestamp::millis(event.startAt);
    record.endAt = StoredTimestamp::fromOptional(event.endAt);
    record.tz = event.tz;
    record.rrule = event.rrule;
    record.exdates = event.exdates;
    record.startAtUtc = StoredTimestamp::fromOptional(event.startAtUtc);
    record.endAtUtc = StoredTimestamp::fromOptional(event.endAtUtc);
    record.reminder = StoredTimestamp::fromOptional(event.reminder);
    return record;
}

EventRecord EventRecord::fromJson(const QJsonObject &object)
{
    EventRecord record;
    record.id = object.value(QLatin1String(IdKey)).toString();
    record.householdId = object.value(QLatin1String(HouseholdKey)).toString();
    record.title = object.value(QLatin1String(TitleKey)).toString();
    record.startAt = StoredTimestamp::fromJson(object.value(QLatin1String(StartKey)));
    record.endAt = StoredTimestamp::fromJson(object.value(QLatin1String(EndKey)));
    record.tz = optionalText(object, TzKey);
    record.rrule = optionalText(object, RruleKey);
    record.exdates = optionalText(object, ExdatesKey);
    record.startAtUtc = cacheFromJson(object.value(QLatin1String(StartUtcKey)));
    record.endAtUtc = cacheFromJson(object.value(QLatin1String(EndUtcKey)));
    record.reminder = cacheFromJson(object.value(QLatin1String(ReminderKey)));
    return record;
}

QJsonObject EventRecord::toJson() const
{
    QJsonObject object;
    object.insert(QLatin1String(IdKey), id);
    object.insert(QLatin1String(HouseholdKey), householdId);
    object.insert(QLatin1String(TitleKey), title);
    putTimestamp(object, StartKey, startAt);
    putTimestamp(object, EndKey, endAt);
    putOptionalText(object, TzKey, tz);
    putOptionalText(object, RruleKey, rrule);
    putOptionalText(object, ExdatesKey, exdates);
    putTimestamp(object, StartUtcKey, startAtUtc);
    putTimestamp(object, EndUtcKey, endAtUtc);
    putTimestamp(object, ReminderKey, reminder);
    return object;
}

bool EventRecord::operator==(const EventRecord &other) const
{
    return id == other.id && householdId == other.householdId && title == other.title
        && startAt == other.startAt && endAt == other.endAt && tz == other.tz && rrule == other.rrule
        && exdates == other.exdates && startAtUtc == other.startAtUtc && endAtUtc == other.endAtUtc
        && reminder == other.reminder;
}

} // namespace data
} // namespace timekeeping
