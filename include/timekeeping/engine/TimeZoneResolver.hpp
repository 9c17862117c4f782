#pragma once

#include <QString>
#include <optional>

namespace timekeeping {
namespace data {
struct CalendarEvent;
struct Household;
}

namespace engine {

class TimeZoneDatabase;

class ResolvedZone
{
public:
    enum class Kind
    {
        Floating,
        Utc,
        Named,
    };

    enum class Source
    {
        Event,
        Household,
        Default,
    };

    static ResolvedZone floating();
    static ResolvedZone utc(Source source = Source::Default);
    static ResolvedZone named(const QString &zoneId, Source source);

    Kind kind() const { return m_kind; }
    Source source() const { return m_source; }
    const QString &id() const { return m_id; }
    bool isFloating() const { return m_kind == Kind::Floating; }
    QString displayName() const;

    bool operator==(const ResolvedZone &other) const;
    bool operator!=(const ResolvedZone &other) const { return !(*this == other); }

private:
    ResolvedZone(Kind kind, Source source, QString id);

    Kind m_kind = Kind::Utc;
    Source m_source = Source::Default;
    QString m_id;
};

// Picks an event's effective zone and converts wall-clock values against the
// injected database. Nonexistent local times (DST gap) move forward to the
// first valid instant after the gap; ambiguous ones (DST overlap) take the
// earlier instant.
class TimeZoneResolver
{
public:
    explicit TimeZoneResolver(const TimeZoneDatabase &database);

    const TimeZoneDatabase &database() const { return m_database; }

    /// Throws E_TZ_UNKNOWN for a non-empty name the database does not know.
    ResolvedZone resolve(const std::optional<QString> &eventTz,
                         const std::optional<QString> &householdTz,
                         bool allDay = false) const;
    ResolvedZone resolve(const data::CalendarEvent &event, const std::optional<QString> &householdTz) const;
    ResolvedZone resolveZoneId(const QString &zoneId, ResolvedZone::Source source) const;

    qint64 toUtc(qint64 wallClock, const ResolvedZone &zone) const;
    qint64 toWallClock(qint64 utcMs, const ResolvedZone &zone) const;
    int offsetSecondsAt(qint64 utcMs, const ResolvedZone &zone) const;

private:
    const TimeZoneDatabase &m_database;
};

} // namespace engine
} // namespace timekeeping
