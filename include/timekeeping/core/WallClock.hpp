#pragma once

#include <QDate>
#include <QString>
#include <QTime>
#include <optional>

namespace timekeeping {
namespace core {

// Wall-clock values are epoch milliseconds read "as if UTC": the calendar
// fields of the value are the local date and time, no offset is implied.
constexpr qint64 MillisPerSecond = 1000;
constexpr qint64 MillisPerDay = 24 * 60 * 60 * MillisPerSecond;

qint64 floorDiv(qint64 value, qint64 divisor);

qint64 wallClockMs(const QDate &date, const QTime &time = QTime(0, 0));
QDate wallClockDate(qint64 wallClock);
QTime wallClockTime(qint64 wallClock);
int millisOfDay(qint64 wallClock);

struct ParsedIsoTime
{
    qint64 wallClock = 0;
    bool hasTime = false;
    // Present when the text carried `Z` or a numeric offset; the value is
    // then an absolute instant at wallClock - offset.
    std::optional<int> offsetSeconds;
};

/// Accepts `YYYY-MM-DD`, `YYYY-MM-DDTHH:MM[:SS[.sss]]` with an optional `Z`
/// or `+HH:MM` suffix, and the basic form `YYYYMMDDTHHMMSSZ`.
std::optional<ParsedIsoTime> parseIsoDateTime(const QString &text);

/// Only `Z`-terminated instants with a time part are accepted.
std::optional<qint64> parseUtcInstant(const QString &text);

QString formatUtcInstant(qint64 utcMs);
QString formatWallClock(qint64 wallClock);

} // namespace core
} // namespace timekeeping
