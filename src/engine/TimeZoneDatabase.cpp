#include "timekeeping/engine/TimeZoneDatabase.hpp"

#include <QDateTime>
#include <QTimeZone>
#include <algorithm>
#include <iterator>

namespace timekeeping {
namespace engine {

SystemTimeZoneDatabase::SystemTimeZoneDatabase(QString version)
    : m_version(std::move(version))
{
}

QString SystemTimeZoneDatabase::version() const
{
    return m_version;
}

bool SystemTimeZoneDatabase::contains(const QString &zoneId) const
{
    return QTimeZone::isTimeZoneIdAvailable(zoneId.toUtf8());
}

int SystemTimeZoneDatabase::offsetFromUtc(const QString &zoneId, qint64 utcMs) const
{
    const QTimeZone zone(zoneId.toUtf8());
    if (!zone.isValid()) {
        return 0;
    }
    return zone.offsetFromUtc(QDateTime::fromMSecsSinceEpoch(utcMs, Qt::UTC));
}

InMemoryTimeZoneDatabase::InMemoryTimeZoneDatabase(QString version)
    : m_version(std::move(version))
{
}

void InMemoryTimeZoneDatabase::addZone(const QString &zoneId, int initialOffsetSeconds,
                                       std::vector<ZoneTransition> transitions)
{
    std::sort(transitions.begin(), transitions.end(), [](const ZoneTransition &lhs, const ZoneTransition &rhs) {
        return lhs.utcMs < rhs.utcMs;
    });
    m_zones.insert(zoneId, Zone{ initialOffsetSeconds, std::move(transitions) });
}

QString InMemoryTimeZoneDatabase::version() const
{
    return m_version;
}

bool InMemoryTimeZoneDatabase::contains(const QString &zoneId) const
{
    return m_zones.contains(zoneId);
}

int InMemoryTimeZoneDatabase::offsetFromUtc(const QString &zoneId, qint64 utcMs) const
{
    const auto it = m_zones.constFind(zoneId);
    if (it == m_zones.constEnd()) {
        return 0;
    }
    const auto &transitions = it->transitions;
    const auto next = std::upper_bound(transitions.cbegin(), transitions.cend(), utcMs,
                                       [](qint64 instant, const ZoneTransition &transition) {
                                           return instant < transition.utcMs;
                                       });
    if (next == transitions.cbegin()) {
        return it->initialOffsetSeconds;
    }
    return std::prev(next)->offsetSeconds;
}

} // namespace engine
} // namespace timekeeping
