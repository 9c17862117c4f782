#include "timekeeping/engine/ExdateSet.hpp"

#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/core/WallClock.hpp"

#include <algorithm>

namespace timekeeping {
namespace engine {

namespace {
QStringList tokens(const QString &text)
{
    QStringList result;
    const QStringList parts = text.split(QLatin1Char(','));
    for (const QString &part : parts) {
        const QString token = part.trimmed();
        if (!token.isEmpty()) {
            result << token;
        }
    }
    return result;
}

bool inRange(qint64 instant, qint64 firstUtc, const std::optional<qint64> &lastUtc)
{
    return instant >= firstUtc && (!lastUtc || instant <= *lastUtc);
}
} // namespace

QString joinUtcInstants(const std::vector<qint64> &instants)
{
    QStringList parts;
    for (const qint64 instant : instants) {
        parts << core::formatUtcInstant(instant);
    }
    return parts.join(QLatin1Char(','));
}

std::optional<QString> ExdateInspection::canonical() const
{
    if (valid.empty()) {
        return std::nullopt;
    }
    return joinUtcInstants(valid);
}

ExdateSet ExdateSet::parse(const QString &text)
{
    ExdateSet set;
    for (const QString &token : tokens(text)) {
        const auto instant = core::parseUtcInstant(token);
        if (!instant) {
            throw core::TimeError(core::TimeErrorCode::ExdateInvalidFormat,
                                  QStringLiteral("not an ISO-8601 UTC instant"), token);
        }
        set.m_instants.insert(*instant);
    }
    return set;
}

ExdateSet ExdateSet::fromInstants(const std::vector<qint64> &instants)
{
    ExdateSet set;
    for (const qint64 instant : instants) {
        set.m_instants.insert(instant);
    }
    return set;
}

ExdateInspection ExdateSet::inspect(const QString &text, qint64 firstUtc, const std::optional<qint64> &lastUtc)
{
    ExdateInspection inspection;
    QSet<qint64> seen;
    for (const QString &token : tokens(text)) {
        const auto instant = core::parseUtcInstant(token);
        if (!instant) {
            inspection.invalidFormat << token;
            continue;
        }
        if (seen.contains(*instant)) {
            ++inspection.duplicates;
            continue;
        }
        seen.insert(*instant);
        if (inRange(*instant, firstUtc, lastUtc)) {
            inspection.valid.push_back(*instant);
        } else {
            inspection.outOfRange.push_back(*instant);
        }
    }
    std::sort(inspection.valid.begin(), inspection.valid.end());
    std::sort(inspection.outOfRange.begin(), inspection.outOfRange.end());
    return inspection;
}

void ExdateSet::checkRange(qint64 firstUtc, const std::optional<qint64> &lastUtc) const
{
    for (const qint64 instant : values()) {
        if (!inRange(instant, firstUtc, lastUtc)) {
            const QString bound = lastUtc ? core::formatUtcInstant(*lastUtc) : QStringLiteral("open");
            throw core::TimeError(core::TimeErrorCode::ExdateOutOfRange,
                                  QStringLiteral("series spans %1 to %2")
                                      .arg(core::formatUtcInstant(firstUtc), bound),
                                  core::formatUtcInstant(instant));
        }
    }
}

std::vector<qint64> ExdateSet::values() const
{
    std::vector<qint64> sorted(m_instants.cbegin(), m_instants.cend());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

QString ExdateSet::canonical() const
{
    return joinUtcInstants(values());
}

} // namespace engine
} // namespace timekeeping
