#include "timekeeping/core/WallClock.hpp"

#include <QRegularExpression>

namespace timekeeping {
namespace core {

namespace {
constexpr qint64 UnixEpochJulianDay = 2440588;

const QRegularExpression &extendedPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^(\\d{4})-(\\d{2})-(\\d{2})"
        "(?:[T ](\\d{2}):(\\d{2})(?::(\\d{2})(?:\\.(\\d{1,3}))?)?)?"
        "(Z|[+-]\\d{2}:?\\d{2})?$"));
    return pattern;
}

const QRegularExpression &basicPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("^(\\d{4})(\\d{2})(\\d{2})T(\\d{2})(\\d{2})(\\d{2})Z$"));
    return pattern;
}

std::optional<int> parseOffset(const QString &suffix)
{
    if (suffix.isEmpty()) {
        return std::nullopt;
    }
    if (suffix == QLatin1String("Z")) {
        return 0;
    }
    QString digits = suffix.mid(1);
    digits.remove(QLatin1Char(':'));
    const int hours = digits.left(2).toInt();
    const int minutes = digits.mid(2, 2).toInt();
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    const int sign = suffix.startsWith(QLatin1Char('-')) ? -1 : 1;
    return sign * (hours * 3600 + minutes * 60);
}

// Pads fractional seconds to milliseconds: ".5" is 500ms.
int fractionToMillis(const QString &fraction)
{
    if (fraction.isEmpty()) {
        return 0;
    }
    return fraction.leftJustified(3, QLatin1Char('0')).toInt();
}
} // namespace

qint64 floorDiv(qint64 value, qint64 divisor)
{
    qint64 quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

qint64 wallClockMs(const QDate &date, const QTime &time)
{
    const qint64 days = date.toJulianDay() - UnixEpochJulianDay;
    const qint64 ofDay = time.isValid() ? time.msecsSinceStartOfDay() : 0;
    return days * MillisPerDay + ofDay;
}

QDate wallClockDate(qint64 wallClock)
{
    return QDate::fromJulianDay(floorDiv(wallClock, MillisPerDay) + UnixEpochJulianDay);
}

int millisOfDay(qint64 wallClock)
{
    return static_cast<int>(wallClock - floorDiv(wallClock, MillisPerDay) * MillisPerDay);
}

QTime wallClockTime(qint64 wallClock)
{
    return QTime::fromMSecsSinceStartOfDay(millisOfDay(wallClock));
}

std::optional<ParsedIsoTime> parseIsoDateTime(const QString &text)
{
    const QString trimmed = text.trimmed();

    const QRegularExpressionMatch basic = basicPattern().match(trimmed);
    if (basic.hasMatch()) {
        const QDate date(basic.captured(1).toInt(), basic.captured(2).toInt(), basic.captured(3).toInt());
        const QTime time(basic.captured(4).toInt(), basic.captured(5).toInt(), basic.captured(6).toInt());
        if (!date.isValid() || !time.isValid()) {
            return std::nullopt;
        }
        ParsedIsoTime parsed;
        parsed.wallClock = wallClockMs(date, time);
        parsed.hasTime = true;
        parsed.offsetSeconds = 0;
        return parsed;
    }

    const QRegularExpressionMatch match = extendedPattern().match(trimmed);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
    if (!date.isValid()) {
        return std::nullopt;
    }

    ParsedIsoTime parsed;
    QTime time(0, 0);
    if (!match.captured(4).isEmpty()) {
        parsed.hasTime = true;
        time = QTime(match.captured(4).toInt(),
                     match.captured(5).toInt(),
                     match.captured(6).toInt(),
                     fractionToMillis(match.captured(7)));
        if (!time.isValid()) {
            return std::nullopt;
        }
    }

    const QString suffix = match.captured(8);
    if (!suffix.isEmpty()) {
        // An offset without a time of day is not an ISO-8601 instant.
        if (!parsed.hasTime) {
            return std::nullopt;
        }
        parsed.offsetSeconds = parseOffset(suffix);
        if (!parsed.offsetSeconds) {
            return std::nullopt;
        }
    }
    parsed.wallClock = wallClockMs(date, time);
    return parsed;
}

std::optional<qint64> parseUtcInstant(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (!trimmed.endsWith(QLatin1Char('Z'))) {
        return std::nullopt;
    }
    const auto parsed = parseIsoDateTime(trimmed);
    if (!parsed || !parsed->hasTime || !parsed->offsetSeconds || *parsed->offsetSeconds != 0) {
        return std::nullopt;
    }
    return parsed->wallClock;
}

QString formatUtcInstant(qint64 utcMs)
{
    const QDate date = wallClockDate(utcMs);
    const QTime time = wallClockTime(utcMs);
    QString text = date.toString(QStringLiteral("yyyy-MM-dd")) + QLatin1Char('T')
        + time.toString(QStringLiteral("HH:mm:ss"));
    if (time.msec() != 0) {
        text += time.toString(QStringLiteral(".zzz"));
    }
    return text + QLatin1Char('Z');
}

QString formatWallClock(qint64 wallClock)
{
    return wallClockDate(wallClock).toString(QStringLiteral("yyyy-MM-dd")) + QLatin1Char('T')
        + wallClockTime(wallClock).toString(QStringLiteral("HH:mm:ss"));
}

} // namespace core
} // namespace timekeeping
