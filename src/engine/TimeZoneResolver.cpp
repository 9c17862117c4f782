#include "timekeeping/engine/TimeZoneResolver.hpp"

#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/core/WallClock.hpp"
#include "timekeeping/data/Event.hpp"
#include "timekeeping/engine/TimeZoneDatabase.hpp"

#include <algorithm>

namespace timekeeping {
namespace engine {

namespace {
std::optional<QString> sanitizeZone(const std::optional<QString> &value)
{
    if (!value) {
        return std::nullopt;
    }
    const QString trimmed = value->trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    return trimmed;
}

bool isUtcAlias(const QString &zoneId)
{
    return zoneId == QLatin1String("UTC") || zoneId == QLatin1String("Etc/UTC");
}
} // namespace

ResolvedZone::ResolvedZone(Kind kind, Source source, QString id)
    : m_kind(kind)
    , m_source(source)
    , m_id(std::move(id))
{
}

ResolvedZone ResolvedZone::floating()
{
    return ResolvedZone(Kind::Floating, Source::Event, QString());
}

ResolvedZone ResolvedZone::utc(Source source)
{
    return ResolvedZone(Kind::Utc, source, QStringLiteral("UTC"));
}

ResolvedZone ResolvedZone::named(const QString &zoneId, Source source)
{
    return ResolvedZone(Kind::Named, source, zoneId);
}

QString ResolvedZone::displayName() const
{
    if (m_kind == Kind::Floating) {
        return QStringLiteral("(floating)");
    }
    return m_id;
}

bool ResolvedZone::operator==(const ResolvedZone &other) const
{
    return m_kind == other.m_kind && m_source == other.m_source && m_id == other.m_id;
}

TimeZoneResolver::TimeZoneResolver(const TimeZoneDatabase &database)
    : m_database(database)
{
}

ResolvedZone TimeZoneResolver::resolve(const std::optional<QString> &eventTz,
                                       const std::optional<QString> &householdTz,
                                       bool allDay) const
{
    if (const auto zone = sanitizeZone(eventTz)) {
        return resolveZoneId(*zone, ResolvedZone::Source::Event);
    }
    if (allDay) {
        return ResolvedZone::floating();
    }
    if (const auto zone = sanitizeZone(householdTz)) {
        return resolveZoneId(*zone, ResolvedZone::Source::Household);
    }
    return ResolvedZone::utc();
}

ResolvedZone TimeZoneResolver::resolve(const data::CalendarEvent &event,
                                       const std::optional<QString> &householdTz) const
{
    return resolve(event.tz, householdTz, event.isAllDay());
}

ResolvedZone TimeZoneResolver::resolveZoneId(const QString &zoneId, ResolvedZone::Source source) const
{
    if (isUtcAlias(zoneId)) {
        return ResolvedZone::utc(source);
    }
    if (!m_database.contains(zoneId)) {
        throw core::TimeError(core::TimeErrorCode::TimezoneUnknown,
                              QStringLiteral("zone is not in timezone database %1").arg(m_database.version()),
                              zoneId);
    }
    return ResolvedZone::named(zoneId, source);
}

int TimeZoneResolver::offsetSecondsAt(qint64 utcMs, const ResolvedZone &zone) const
{
    if (zone.kind() != ResolvedZone::Kind::Named) {
        return 0;
    }
    return m_database.offsetFromUtc(zone.id(), utcMs);
}

qint64 TimeZoneResolver::toUtc(qint64 wallClock, const ResolvedZone &zone) const
{
    if (zone.kind() != ResolvedZone::Kind::Named) {
        return wallClock;
    }

    // Offsets a day either side bracket any single transition affecting this
    // wall-clock value. A candidate is real when the zone agrees with the
    // offset it was derived from.
    const int before = offsetSecondsAt(wallClock - core::MillisPerDay, zone);
    const int after = offsetSecondsAt(wallClock + core::MillisPerDay, zone);
    const qint64 early = wallClock - before * core::MillisPerSecond;
    const qint64 late = wallClock - after * core::MillisPerSecond;
    const bool earlyValid = offsetSecondsAt(early, zone) == before;
    const bool lateValid = offsetSecondsAt(late, zone) == after;

    if (earlyValid && lateValid) {
        return std::min(early, late);
    }
    if (earlyValid) {
        return early;
    }
    if (lateValid) {
        return late;
    }
    // Gap: the first valid instant is the transition itself, somewhere in
    // (late, early].
    if (offsetSecondsAt(early, zone) != after) {
        return early;
    }
    qint64 invalid = late;
    qint64 valid = early;
    while (valid - invalid > 1) {
        const qint64 middle = invalid + (valid - invalid) / 2;
        if (offsetSecondsAt(middle, zone) == after) {
            valid = middle;
        } else {
            invalid = middle;
        }
    }
    return valid;
}

qint64 TimeZoneResolver::toWallClock(qint64 utcMs, const ResolvedZone &zone) const
{
    return utcMs + offsetSecondsAt(utcMs, zone) * core::MillisPerSecond;
}

} // namespace engine
} // namespace timekeeping
