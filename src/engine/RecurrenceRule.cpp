#include "timekeeping/engine/RecurrenceRule.hpp"

#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/core/WallClock.hpp"

#include <QRegularExpression>
#include <QSet>
#include <QStringList>
#include <array>

namespace timekeeping {
namespace engine {

namespace {
using core::TimeError;
using core::TimeErrorCode;

constexpr auto RrulePrefix = "RRULE:";

struct WeekdayCode
{
    Qt::DayOfWeek day;
    const char *code;
};

constexpr std::array<WeekdayCode, 7> kWeekdayCodes = { {
    { Qt::Monday, "MO" },
    { Qt::Tuesday, "TU" },
    { Qt::Wednesday, "WE" },
    { Qt::Thursday, "TH" },
    { Qt::Friday, "FR" },
    { Qt::Saturday, "SA" },
    { Qt::Sunday, "SU" },
} };

[[noreturn]] void unsupported(const QString &key, const QString &detail)
{
    throw TimeError(TimeErrorCode::RruleUnsupportedField, detail, key);
}

[[noreturn]] void malformed(const QString &subject, const QString &detail)
{
    throw TimeError(TimeErrorCode::RruleParse, detail, subject);
}

std::optional<int> parsePositive(const QString &value)
{
    static const QRegularExpression digits(QStringLiteral("^\\d+$"));
    if (!digits.match(value).hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed <= 0) {
        return std::nullopt;
    }
    return parsed;
}
} // namespace

QString weekdayCode(Qt::DayOfWeek day)
{
    for (const auto &entry : kWeekdayCodes) {
        if (entry.day == day) {
            return QLatin1String(entry.code);
        }
    }
    return QString();
}

std::optional<Qt::DayOfWeek> weekdayFromCode(const QString &code)
{
    for (const auto &entry : kWeekdayCodes) {
        if (code == QLatin1String(entry.code)) {
            return entry.day;
        }
    }
    return std::nullopt;
}

QString RecurrenceRule::toString() const
{
    QStringList parts;
    parts << QStringLiteral("FREQ=%1").arg(frequency == Frequency::Weekly ? QStringLiteral("WEEKLY")
                                                                          : QStringLiteral("DAILY"));
    parts << QStringLiteral("INTERVAL=%1").arg(interval);
    if (count) {
        parts << QStringLiteral("COUNT=%1").arg(*count);
    }
    if (until) {
        parts << QStringLiteral("UNTIL=%1%2Z")
                     .arg(core::wallClockDate(*until).toString(QStringLiteral("yyyyMMdd")),
                          core::wallClockTime(*until).toString(QStringLiteral("'T'HHmmss")));
    }
    if (!byDay.empty()) {
        QStringList days;
        for (const Qt::DayOfWeek day : byDay) {
            days << weekdayCode(day);
        }
        parts << QStringLiteral("BYDAY=%1").arg(days.join(QLatin1Char(',')));
    }
    return parts.join(QLatin1Char(';'));
}

bool RecurrenceRule::operator==(const RecurrenceRule &other) const
{
    return frequency == other.frequency && interval == other.interval && count == other.count
        && until == other.until && byDay == other.byDay;
}

RecurrenceRule parseRecurrenceRule(const QString &text)
{
    QString body = text.trimmed();
    if (body.startsWith(QLatin1String(RrulePrefix), Qt::CaseInsensitive)) {
        body = body.mid(static_cast<int>(qstrlen(RrulePrefix))).trimmed();
    }
    if (body.isEmpty()) {
        malformed(QString(), QStringLiteral("recurrence rule is empty"));
    }

    RecurrenceRule rule;
    QSet<QString> seen;
    const QStringList parts = body.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString &rawPart : parts) {
        const QString part = rawPart.trimmed();
        const int equals = part.indexOf(QLatin1Char('='));
        if (equals <= 0) {
            malformed(part, QStringLiteral("expected KEY=VALUE"));
        }
        const QString key = part.left(equals).trimmed().toUpper();
        const QString value = part.mid(equals + 1).trimmed();
        if (seen.contains(key)) {
            malformed(key, QStringLiteral("key appears more than once"));
        }
        seen.insert(key);

        if (key == QLatin1String("FREQ")) {
            const QString upper = value.toUpper();
            if (upper == QLatin1String("DAILY")) {
                rule.frequency = Frequency::Daily;
            } else if (upper == QLatin1String("WEEKLY")) {
                rule.frequency = Frequency::Weekly;
            } else {
                unsupported(key, QStringLiteral("only DAILY and WEEKLY are supported, got '%1'").arg(value));
            }
        } else if (key == QLatin1String("INTERVAL")) {
            const auto interval = parsePositive(value);
            if (!interval) {
                unsupported(key, QStringLiteral("INTERVAL must be a positive integer, got '%1'").arg(value));
            }
            rule.interval = *interval;
        } else if (key == QLatin1String("COUNT")) {
            const auto count = parsePositive(value);
            if (!count) {
                unsupported(key, QStringLiteral("COUNT must be a positive integer, got '%1'").arg(value));
            }
            rule.count = *count;
        } else if (key == QLatin1String("UNTIL")) {
            const auto until = core::parseUtcInstant(value);
            if (!until) {
                unsupported(key, QStringLiteral("UNTIL must be a UTC instant, got '%1'").arg(value));
            }
            rule.until = *until;
        } else if (key == QLatin1String("BYDAY")) {
            const QStringList codes = value.split(QLatin1Char(','));
            for (const QString &rawCode : codes) {
                const auto day = weekdayFromCode(rawCode.trimmed().toUpper());
                if (!day) {
                    unsupported(key, QStringLiteral("unsupported weekday '%1'").arg(rawCode.trimmed()));
                }
                rule.byDay.insert(*day);
            }
        } else {
            unsupported(key, QStringLiteral("field is not supported"));
        }
    }

    if (!seen.contains(QStringLiteral("FREQ"))) {
        malformed(QStringLiteral("FREQ"), QStringLiteral("FREQ is required"));
    }
    if (!rule.byDay.empty() && rule.frequency != Frequency::Weekly) {
        unsupported(QStringLiteral("BYDAY"), QStringLiteral("BYDAY is only supported with FREQ=WEEKLY"));
    }
    return rule;
}

} // namespace engine
} // namespace timekeeping
