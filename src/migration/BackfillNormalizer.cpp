#include "timekeeping/migration/BackfillNormalizer.hpp"

#include "timekeeping/core/Logging.hpp"
#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/core/WallClock.hpp"
#include "timekeeping/data/EventRepository.hpp"
#include "timekeeping/engine/ExdateSet.hpp"
#include "timekeeping/engine/OccurrenceExpander.hpp"
#include "timekeeping/engine/RecurrenceRule.hpp"

#include <QHash>
#include <QMap>
#include <algorithm>

namespace timekeeping {
namespace migration {

namespace {
using data::StoredTimestamp;
using engine::ResolvedZone;
using engine::TimeZoneResolver;

std::optional<QString> sanitizeZone(const std::optional<QString> &value)
{
    if (!value || value->trimmed().isEmpty()) {
        return std::nullopt;
    }
    return value->trimmed();
}

// Wall-clock columns: text without an offset already is local time, text
// with one names an instant that is read back in @p zone.
bool decodeWallClock(const StoredTimestamp &stored, const TimeZoneResolver &resolver, const ResolvedZone &zone,
                     std::optional<qint64> &value)
{
    switch (stored.encoding()) {
    case StoredTimestamp::Encoding::Missing:
        value.reset();
        return true;
    case StoredTimestamp::Encoding::EpochMillis:
        value = std::get<StoredTimestamp::EpochMillis>(stored.value()).value;
        return true;
    case StoredTimestamp::Encoding::EpochSeconds:
        value = std::get<StoredTimestamp::EpochSeconds>(stored.value()).value * core::MillisPerSecond;
        return true;
    case StoredTimestamp::Encoding::IsoText: {
        const auto parsed = core::parseIsoDateTime(std::get<StoredTimestamp::IsoText>(stored.value()).value);
        if (!parsed) {
            return false;
        }
        if (!parsed->offsetSeconds) {
            value = parsed->wallClock;
            return true;
        }
        const qint64 instant = parsed->wallClock - *parsed->offsetSeconds * core::MillisPerSecond;
        value = resolver.toWallClock(instant, zone);
        return true;
    }
    }
    return false;
}

// Absolute columns: text without an offset is local time in @p zone.
bool decodeInstant(const StoredTimestamp &stored, const TimeZoneResolver &resolver, const ResolvedZone &zone,
                   std::optional<qint64> &value)
{
    if (stored.encoding() != StoredTimestamp::Encoding::IsoText) {
        return decodeWallClock(stored, resolver, zone, value);
    }
    const auto parsed = core::parseIsoDateTime(std::get<StoredTimestamp::IsoText>(stored.value()).value);
    if (!parsed) {
        return false;
    }
    if (parsed->offsetSeconds) {
        value = parsed->wallClock - *parsed->offsetSeconds * core::MillisPerSecond;
    } else {
        value = resolver.toUtc(parsed->wallClock, zone);
    }
    return true;
}

QHash<QString, std::optional<QString>> zonesByHousehold(const std::vector<data::Household> &households)
{
    QHash<QString, std::optional<QString>> zones;
    for (const data::Household &household : households) {
        zones.insert(household.id, household.tz);
    }
    return zones;
}

QString invalidTimestamp(const char *column, const StoredTimestamp &stored)
{
    return QStringLiteral("invalid %1 timestamp %2").arg(QLatin1String(column), stored.describe());
}
} // namespace

QString backfillStatusName(BackfillStatus status)
{
    switch (status) {
    case BackfillStatus::Completed:
        return QStringLiteral("completed");
    case BackfillStatus::Cancelled:
        return QStringLiteral("cancelled");
    case BackfillStatus::Failed:
    default:
        return QStringLiteral("failed");
    }
}

BackfillNormalizer::BackfillNormalizer(const engine::TimeZoneDatabase &database)
    : m_resolver(database)
{
}

std::optional<data::EventRecord> BackfillNormalizer::normalize(const data::EventRecord &record,
                                                               const std::optional<QString> &householdTz,
                                                               QString *reason) const
{
    const auto skip = [reason](const QString &why) {
        if (reason) {
            *reason = why;
        }
        return std::nullopt;
    };

    data::CalendarEvent event;
    event.id = record.id;
    event.householdId = record.householdId;
    event.title = record.title;
    event.tz = sanitizeZone(record.tz);
    event.rrule = record.rrule;
    event.exdates = record.exdates;

    try {
        // Offset-bearing text is read before the all-day check can run, so
        // it uses the zone a timed event would get.
        const ResolvedZone readingZone = m_resolver.resolve(event.tz, householdTz);

        std::optional<qint64> start;
        if (record.startAt.isMissing()) {
            return skip(QStringLiteral("missing start_at"));
        }
        if (!decodeWallClock(record.startAt, m_resolver, readingZone, start)) {
            return skip(invalidTimestamp("start_at", record.startAt));
        }
        if (!decodeWallClock(record.endAt, m_resolver, readingZone, event.endAt)) {
            return skip(invalidTimestamp("end_at", record.endAt));
        }
        event.startAt = *start;
        if (event.endAt && *event.endAt < event.startAt) {
            return skip(QStringLiteral("end_at precedes start_at"));
        }

        const ResolvedZone zone = m_resolver.resolve(event, householdTz);
        if (!decodeInstant(record.reminder, m_resolver, zone, event.reminder)) {
            return skip(invalidTimestamp("reminder", record.reminder));
        }

        qint64 firstLocal = event.startAt;
        qint64 firstUtc = m_resolver.toUtc(event.startAt, zone);
        if (event.isRecurring()) {
            const engine::OccurrenceExpander expander(m_resolver, engine::parseRecurrenceRule(*event.rrule),
                                                      event.startAt, zone);
            const auto first = expander.firstOccurrence();
            if (first) {
                firstLocal = first->localStart;
                firstUtc = first->utcStart;
            }
            if (event.exdates) {
                const auto last = expander.lastOccurrence();
                const engine::ExdateInspection inspection = engine::ExdateSet::inspect(
                    *event.exdates, first ? firstUtc : engine::OccurrenceExpander::Unbounded,
                    last ? std::optional<qint64>(last->utcStart) : std::nullopt);
                if (!inspection.isClean()) {
                    qCInfo(TIMEKEEPING_BACKFILL_LOG)
                        << "Event" << event.id << "drops" << inspection.invalidFormat.size() << "malformed,"
                        << inspection.outOfRange.size() << "out of range and" << inspection.duplicates
                        << "duplicate excluded dates";
                }
                event.exdates = inspection.canonical();
            }
        }

        event.startAtUtc = firstUtc;
        if (event.endAt) {
            event.endAtUtc = m_resolver.toUtc(firstLocal + event.wallClockDuration(), zone);
        }
    } catch (const core::TimeError &error) {
        return skip(QString::fromUtf8(error.what()));
    }

    return data::EventRecord::fromCanonical(event);
}

BackfillSummary BackfillNormalizer::run(data::EventRepository &repository, const BackfillOptions &options,
                                        const BackfillControl *control, const ProgressCallback &progress) const
{
    BackfillSummary summary;
    const int batchSize = std::clamp(options.batchSize, MinBatchSize, MaxBatchSize);
    if (batchSize != options.batchSize) {
        qCWarning(TIMEKEEPING_BACKFILL_LOG) << "Batch size" << options.batchSize << "clamped to" << batchSize;
    }

    const std::vector<data::EventRecord> rows =
        options.householdId ? repository.fetchEvents(*options.householdId) : repository.fetchAllEvents();
    const QHash<QString, std::optional<QString>> zones = zonesByHousehold(repository.households());
    const int total = static_cast<int>(rows.size());

    qCInfo(TIMEKEEPING_BACKFILL_LOG) << "Backfill started for"
                                     << (options.householdId ? *options.householdId : QStringLiteral("all households"))
                                     << "rows:" << total << "batch size:" << batchSize
                                     << "dry run:" << options.dryRun;

    for (int offset = 0; offset < total; offset += batchSize) {
        if (control && control->isCancelled()) {
            summary.status = BackfillStatus::Cancelled;
            break;
        }

        std::vector<data::EventRecord> changed;
        const int end = std::min(total, offset + batchSize);
        for (int i = offset; i < end; ++i) {
            const data::EventRecord &row = rows[static_cast<size_t>(i)];
            ++summary.scanned;
            QString reason;
            auto normalized = normalize(row, zones.value(row.householdId), &reason);
            if (!normalized) {
                ++summary.skipped;
                if (static_cast<int>(summary.skipExamples.size()) < MaxSkipExamples) {
                    summary.skipExamples.push_back(BackfillSkip{ row.id, reason });
                }
                qCWarning(TIMEKEEPING_BACKFILL_LOG) << "Skipping event" << row.id << reason;
                continue;
            }
            if (*normalized != row) {
                changed.push_back(std::move(*normalized));
            }
        }

        if (!options.dryRun && !changed.empty() && !repository.commitBatch(changed)) {
            qCCritical(TIMEKEEPING_BACKFILL_LOG) << "Batch starting at row" << offset << "could not be committed";
            summary.status = BackfillStatus::Failed;
            break;
        }
        summary.updated += static_cast<int>(changed.size());
        ++summary.batches;

        if (progress) {
            progress(BackfillProgress{ summary.scanned, summary.updated, summary.skipped, total - summary.scanned,
                                       summary.batches });
        }
    }

    qCInfo(TIMEKEEPING_BACKFILL_LOG) << "Backfill" << backfillStatusName(summary.status) << "scanned:"
                                     << summary.scanned << "updated:" << summary.updated
                                     << "skipped:" << summary.skipped << "batches:" << summary.batches;
    return summary;
}

RoundTripReport BackfillNormalizer::verifyRoundTrip(const std::vector<data::EventRecord> &before,
                                                    const std::vector<data::EventRecord> &after,
                                                    const std::vector<data::Household> &households) const
{
    RoundTripReport report;
    const QHash<QString, std::optional<QString>> zones = zonesByHousehold(households);

    QMap<QString, const data::EventRecord *> afterById;
    for (const data::EventRecord &record : after) {
        afterById.insert(record.id, &record);
    }
    QMap<QString, const data::EventRecord *> beforeById;
    for (const data::EventRecord &record : before) {
        beforeById.insert(record.id, &record);
    }

    for (auto it = afterById.cbegin(); it != afterById.cend(); ++it) {
        if (!beforeById.contains(it.key())) {
            report.issues.push_back(RoundTripIssue{ it.key(), QStringLiteral("row appeared during backfill") });
        }
    }

    for (auto it = beforeById.cbegin(); it != beforeById.cend(); ++it) {
        const data::EventRecord &original = *it.value();
        const data::EventRecord *current = afterById.value(it.key(), nullptr);
        if (!current) {
            report.issues.push_back(RoundTripIssue{ it.key(), QStringLiteral("row missing after backfill") });
            continue;
        }
        ++report.checked;

        const std::optional<QString> householdTz = zones.value(original.householdId);
        QString reason;
        const auto expected = normalize(original, householdTz, &reason);
        if (!expected) {
            if (*current != original) {
                report.issues.push_back(RoundTripIssue{
                    it.key(), QStringLiteral("row could not be normalized (%1) but was modified").arg(reason) });
            }
            continue;
        }

        if (current->startAt != expected->startAt || current->endAt != expected->endAt) {
            report.issues.push_back(RoundTripIssue{
                it.key(), QStringLiteral("wall-clock value changed: start_at %1, expected %2")
                              .arg(current->startAt.describe(), expected->startAt.describe()) });
        }
        if (current->startAtUtc != expected->startAtUtc || current->endAtUtc != expected->endAtUtc) {
            report.issues.push_back(RoundTripIssue{
                it.key(), QStringLiteral("UTC cache %1 does not match recomputed %2")
                              .arg(current->startAtUtc.describe(), expected->startAtUtc.describe()) });
        }
        const auto again = normalize(*current, householdTz);
        if (!again || *again != *current) {
            report.issues.push_back(RoundTripIssue{ it.key(), QStringLiteral("normalizing again changes the row") });
        }
    }

    if (!report.ok()) {
        qCWarning(TIMEKEEPING_BACKFILL_LOG) << "Round-trip verification found" << report.issues.size()
                                            << "issues in" << report.checked << "rows";
    }
    return report;
}

} // namespace migration
} // namespace timekeeping
