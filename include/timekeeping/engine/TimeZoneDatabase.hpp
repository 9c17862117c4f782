#pragma once

#include <QHash>
#include <QString>
#include <vector>

namespace timekeeping {
namespace engine {

// Versioned source of UTC offsets. Implementations are immutable after
// construction and safe to share between threads.
class TimeZoneDatabase
{
public:
    virtual ~TimeZoneDatabase() = default;

    virtual QString version() const = 0;
    virtual bool contains(const QString &zoneId) const = 0;
    /// Offset in seconds east of UTC in effect at @p utcMs.
    virtual int offsetFromUtc(const QString &zoneId, qint64 utcMs) const = 0;
};

// Backed by the IANA data Qt finds on the host (QTimeZone).
class SystemTimeZoneDatabase : public TimeZoneDatabase
{
public:
    explicit SystemTimeZoneDatabase(QString version = QStringLiteral("system"));

    QString version() const override;
    bool contains(const QString &zoneId) const override;
    int offsetFromUtc(const QString &zoneId, qint64 utcMs) const override;

private:
    QString m_version;
};

struct ZoneTransition
{
    qint64 utcMs = 0;
    int offsetSeconds = 0;
};

// Explicit transition tables. Used to pin tz data to a known release and to
// compare two releases against each other.
class InMemoryTimeZoneDatabase : public TimeZoneDatabase
{
public:
    explicit InMemoryTimeZoneDatabase(QString version);

    /// @p transitions need not be sorted; before the first one the zone
    /// uses @p initialOffsetSeconds.
    void addZone(const QString &zoneId, int initialOffsetSeconds, std::vector<ZoneTransition> transitions = {});

    QString version() const override;
    bool contains(const QString &zoneId) const override;
    int offsetFromUtc(const QString &zoneId, qint64 utcMs) const override;

private:
    struct Zone
    {
        int initialOffsetSeconds = 0;
        std::vector<ZoneTransition> transitions;
    };

    QString m_version;
    QHash<QString, Zone> m_zones;
};

} // namespace engine
} // namespace timekeeping
