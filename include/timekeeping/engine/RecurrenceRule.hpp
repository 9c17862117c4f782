#pragma once

#include <QString>
#include <optional>
#include <set>

namespace timekeeping {
namespace engine {

enum class Frequency
{
    Daily,
    Weekly,
};

// Restricted RRULE: FREQ=DAILY|WEEKLY, INTERVAL, COUNT, UNTIL, BYDAY.
struct RecurrenceRule
{
    Frequency frequency = Frequency::Daily;
    int interval = 1;
    std::optional<int> count;
    std::optional<qint64> until; // inclusive, UTC ms
    std::set<Qt::DayOfWeek> byDay;

    bool isBounded() const { return count.has_value() || until.has_value(); }
    QString toString() const;

    bool operator==(const RecurrenceRule &other) const;
    bool operator!=(const RecurrenceRule &other) const { return !(*this == other); }
};

/// Throws core::TimeError: E_RRULE_PARSE for malformed structure,
/// E_RRULE_UNSUPPORTED_FIELD (subject = key) for keys or values outside the
/// supported grammar.
RecurrenceRule parseRecurrenceRule(const QString &text);

QString weekdayCode(Qt::DayOfWeek day);
std::optional<Qt::DayOfWeek> weekdayFromCode(const QString &code);

} // namespace engine
} // namespace timekeeping
