#include "timekeeping/engine/EventValidator.hpp"

#include "timekeeping/core/Logging.hpp"
#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/core/WallClock.hpp"
#include "timekeeping/data/Event.hpp"
#include "timekeeping/engine/ExdateSet.hpp"
#include "timekeeping/engine/OccurrenceExpander.hpp"
#include "timekeeping/engine/RecurrenceRule.hpp"
#include "timekeeping/engine/TimeZoneResolver.hpp"

namespace timekeeping {
namespace engine {

EventValidator::EventValidator(const TimeZoneResolver &resolver)
    : m_resolver(resolver)
{
}

ValidationReport EventValidator::validate(const data::CalendarEvent &event,
                                          const std::optional<QString> &householdTz) const
{
    if (event.endAt && *event.endAt < event.startAt) {
        throw core::TimeError(core::TimeErrorCode::RangeInvalid,
                              QStringLiteral("end %1 precedes start %2")
                                  .arg(core::formatWallClock(*event.endAt), core::formatWallClock(event.startAt)),
                              event.id);
    }

    const ResolvedZone zone = m_resolver.resolve(event, householdTz);

    ValidationReport report;
    const ExdateSet exdates = event.exdates ? ExdateSet::parse(*event.exdates) : ExdateSet();
    if (!event.isRecurring()) {
        if (!exdates.isEmpty()) {
            report.exdatesWithoutRule = true;
            qCInfo(TIMEKEEPING_LOG) << "Event" << event.id << "has excluded dates but no recurrence rule";
        }
        return report;
    }

    const OccurrenceExpander expander(m_resolver, parseRecurrenceRule(*event.rrule), event.startAt, zone);
    if (exdates.isEmpty()) {
        return report;
    }

    const auto first = expander.firstOccurrence();
    if (!first) {
        throw core::TimeError(core::TimeErrorCode::ExdateOutOfRange, QStringLiteral("series has no occurrences"),
                              core::formatUtcInstant(exdates.values().front()));
    }
    const auto last = expander.lastOccurrence();
    exdates.checkRange(first->utcStart, last ? std::optional<qint64>(last->utcStart) : std::nullopt);

    for (const qint64 instant : exdates.values()) {
        if (!expander.isOccurrence(instant)) {
            report.unmatchedExdates.push_back(instant);
            qCInfo(TIMEKEEPING_LOG) << "Event" << event.id << "excludes" << core::formatUtcInstant(instant)
                                    << "which is not an occurrence";
        }
    }
    return report;
}

} // namespace engine
} // namespace timekeeping
