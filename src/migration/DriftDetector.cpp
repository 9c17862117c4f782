#include "timekeeping/migration/DriftDetector.hpp"

#include "timekeeping/core/Logging.hpp"
#include "timekeeping/core/WallClock.hpp"
#include "timekeeping/data/Event.hpp"
#include "timekeeping/data/EventRepository.hpp"
#include "timekeeping/engine/OccurrenceExpander.hpp"
#include "timekeeping/engine/RecurrenceRule.hpp"
#include "timekeeping/engine/TimeZoneDatabase.hpp"

#include <QHash>
#include <QStringList>
#include <algorithm>
#include <cstdlib>

namespace timekeeping {
namespace migration {

namespace {
qint64 distance(qint64 lhs, qint64 rhs)
{
    return std::llabs(lhs - rhs);
}

// All-day caches may sit on either neighbouring midnight depending on the
// zone they were computed in.
bool allDayShiftAllowed(qint64 stored, qint64 recomputed)
{
    if (core::millisOfDay(stored) != 0) {
        return false;
    }
    const qint64 storedDay = core::floorDiv(stored, core::MillisPerDay);
    const qint64 recomputedDay = core::floorDiv(recomputed, core::MillisPerDay);
    return std::llabs(storedDay - recomputedDay) <= 1;
}

QString formatOptional(const std::optional<qint64> &instant)
{
    return instant ? core::formatUtcInstant(*instant) : QStringLiteral("-");
}
} // namespace

QString driftCategoryName(DriftCategory category)
{
    switch (category) {
    case DriftCategory::TimedMismatch:
        return QStringLiteral("timed_mismatch");
    case DriftCategory::AlldayBoundaryError:
        return QStringLiteral("allday_boundary_error");
    case DriftCategory::TzUnknown:
    default:
        return QStringLiteral("tz_unknown");
    }
}

QString formatHumanSummary(const DriftReport &report)
{
    QStringList lines;
    lines << QStringLiteral("Time Invariants Drift Report");
    lines << QStringLiteral("============================");
    lines << QStringLiteral("Timezone data:  %1").arg(report.databaseVersion);
    lines << QStringLiteral("Events checked: %1").arg(report.totalEvents);
    lines << QStringLiteral("Drift events:   %1").arg(report.findings.size());
    lines << (report.hasDrift() ? QStringLiteral("Status:         Drift detected")
                                : QStringLiteral("Status:         OK (no drift detected)"));

    const auto appendCounts = [&lines](const QString &title, const QMap<QString, int> &counts) {
        lines << QString() << title;
        if (counts.isEmpty()) {
            lines << QStringLiteral("  (none)");
        }
        for (auto it = counts.cbegin(); it != counts.cend(); ++it) {
            lines << QStringLiteral("  %1: %2").arg(it.key()).arg(it.value());
        }
    };
    appendCounts(QStringLiteral("By category:"), report.countsByCategory);
    appendCounts(QStringLiteral("By household:"), report.countsByHousehold);

    if (report.hasDrift()) {
        lines << QString() << QStringLiteral("Findings:");
        for (const DriftFinding &finding : report.findings) {
            lines << QStringLiteral("  %1 %2 [%3] stored %4 recomputed %5 delta %6ms")
                         .arg(QString::fromLatin1(core::timeErrorCodeString(finding.code)), finding.eventId,
                              driftCategoryName(finding.category), formatOptional(finding.storedStartUtc),
                              formatOptional(finding.recomputedStartUtc))
                         .arg(finding.deltaMs);
        }
        lines << QString() << QStringLiteral("Review the affected items before continuing.");
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

DriftDetector::DriftDetector(const engine::TimeZoneDatabase &database, qint64 toleranceMs)
    : m_resolver(database)
    , m_toleranceMs(toleranceMs)
{
}

std::optional<DriftFinding> DriftDetector::evaluate(const data::CalendarEvent &event,
                                                    const std::optional<QString> &householdTz) const
{
    if (!event.startAtUtc) {
        return std::nullopt;
    }

    DriftFinding finding;
    finding.eventId = event.id;
    finding.householdId = event.householdId;
    finding.storedStartUtc = event.startAtUtc;
    finding.storedEndUtc = event.endAtUtc;

    qint64 firstLocal = event.startAt;
    qint64 firstUtc = 0;
    std::optional<engine::ResolvedZone> zone;
    try {
        zone = m_resolver.resolve(event, householdTz);
        firstUtc = m_resolver.toUtc(event.startAt, *zone);
        if (event.isRecurring()) {
            const engine::OccurrenceExpander expander(m_resolver, engine::parseRecurrenceRule(*event.rrule),
                                                      event.startAt, *zone);
            if (const auto first = expander.firstOccurrence()) {
                firstLocal = first->localStart;
                firstUtc = first->utcStart;
            }
        }
    } catch (const core::TimeError &error) {
        if (error.code() != core::TimeErrorCode::TimezoneUnknown) {
            qCWarning(TIMEKEEPING_DRIFT_LOG) << "Cannot recompute event" << event.id << error.what();
            return std::nullopt;
        }
        finding.code = core::TimeErrorCode::TimezoneUnknown;
        finding.category = DriftCategory::TzUnknown;
        return finding;
    }

    finding.recomputedStartUtc = firstUtc;
    if (event.endAt) {
        finding.recomputedEndUtc = m_resolver.toUtc(firstLocal + event.wallClockDuration(), *zone);
    }

    qint64 delta = distance(*event.startAtUtc, firstUtc);
    if (event.endAtUtc && finding.recomputedEndUtc) {
        delta = std::max(delta, distance(*event.endAtUtc, *finding.recomputedEndUtc));
    }
    finding.deltaMs = delta;

    if (event.isAllDay()) {
        bool ok = allDayShiftAllowed(*event.startAtUtc, firstUtc);
        if (finding.recomputedEndUtc) {
            ok = ok && event.endAtUtc && allDayShiftAllowed(*event.endAtUtc, *finding.recomputedEndUtc);
        }
        if (ok) {
            return std::nullopt;
        }
        finding.category = DriftCategory::AlldayBoundaryError;
        return finding;
    }

    if (delta < m_toleranceMs) {
        return std::nullopt;
    }
    finding.category = DriftCategory::TimedMismatch;
    return finding;
}

DriftReport DriftDetector::run(const data::EventRepository &repository,
                               const std::optional<QString> &householdId) const
{
    DriftReport report;
    report.databaseVersion = m_resolver.database().version();

    QHash<QString, std::optional<QString>> zones;
    for (const data::Household &household : repository.households()) {
        zones.insert(household.id, household.tz);
    }

    const std::vector<data::EventRecord> rows =
        householdId ? repository.fetchEvents(*householdId) : repository.fetchAllEvents();
    for (const data::EventRecord &record : rows) {
        const auto event = record.toCanonical();
        if (!event) {
            qCWarning(TIMEKEEPING_DRIFT_LOG) << "Skipping event" << record.id << "with legacy timestamps";
            continue;
        }
        if (!event->startAtUtc) {
            continue;
        }
        ++report.totalEvents;

        auto finding = evaluate(*event, zones.value(event->householdId));
        if (!finding) {
            continue;
        }
        qCWarning(TIMEKEEPING_DRIFT_LOG) << core::timeErrorCodeString(finding->code) << "event" << finding->eventId
                                         << driftCategoryName(finding->category) << "delta" << finding->deltaMs;
        ++report.countsByCategory[driftCategoryName(finding->category)];
        ++report.countsByHousehold[finding->householdId];
        report.findings.push_back(std::move(*finding));
    }

    qCInfo(TIMEKEEPING_DRIFT_LOG) << "Drift check against" << report.databaseVersion << "checked"
                                  << report.totalEvents << "events, found" << report.findings.size();
    return report;
}

} // namespace migration
} // namespace timekeeping
