#include "timekeeping/engine/OccurrenceExpander.hpp"

#include "timekeeping/core/WallClock.hpp"

#include <algorithm>

namespace timekeeping {
namespace engine {

namespace {
// Local values more than a day before a UTC instant always convert to an
// earlier instant, whatever the zone offset.
constexpr qint64 LocalSlack = core::MillisPerDay;

SeriesCadence cadenceFor(const RecurrenceRule &rule, qint64 anchorLocal)
{
    SeriesCadence cadence;
    const qint64 anchorDay = core::floorDiv(anchorLocal, core::MillisPerDay);
    cadence.timeOfDay = anchorLocal - anchorDay * core::MillisPerDay;

    if (rule.frequency == Frequency::Daily) {
        cadence.periodStartDay = anchorDay;
        cadence.periodLengthDays = rule.interval;
        cadence.slotOffsets = { 0 };
        return cadence;
    }

    const int anchorWeekday = core::wallClockDate(anchorLocal).dayOfWeek();
    cadence.periodStartDay = anchorDay - (anchorWeekday - 1);
    cadence.periodLengthDays = 7LL * rule.interval;
    if (rule.byDay.empty()) {
        cadence.slotOffsets = { anchorWeekday - 1 };
    } else {
        for (const Qt::DayOfWeek day : rule.byDay) {
            cadence.slotOffsets.push_back(static_cast<int>(day) - 1);
        }
    }
    cadence.skippedInFirstPeriod = static_cast<int>(
        std::count_if(cadence.slotOffsets.cbegin(), cadence.slotOffsets.cend(),
                      [anchorWeekday](qint64 offset) { return offset < anchorWeekday - 1; }));
    return cadence;
}
} // namespace

qint64 SeriesCadence::indexOf(qint64 period, qint64 slot) const
{
    if (period == 0) {
        return slot - skippedInFirstPeriod;
    }
    const qint64 firstPeriodCount = slotCount() - skippedInFirstPeriod;
    return firstPeriodCount + (period - 1) * slotCount() + slot;
}

qint64 SeriesCadence::localStart(qint64 period, qint64 slot) const
{
    const qint64 day = periodStartDay + period * periodLengthDays + slotOffsets[static_cast<size_t>(slot)];
    return day * core::MillisPerDay + timeOfDay;
}

OccurrenceSequence::OccurrenceSequence(const TimeZoneResolver &resolver, SeriesCadence cadence, ResolvedZone zone,
                                       std::optional<int> count, std::optional<qint64> until, ExdateSet exdates,
                                       qint64 from, qint64 to)
    : m_resolver(&resolver)
    , m_cadence(std::move(cadence))
    , m_zone(std::move(zone))
    , m_count(count)
    , m_until(until)
    , m_exdates(std::move(exdates))
    , m_from(from)
    , m_to(to)
{
    reset();
}

void OccurrenceSequence::reset()
{
    m_period = 0;
    m_slot = m_cadence.skippedInFirstPeriod;
    m_done = m_from >= m_to;
    if (m_done || m_from < OccurrenceExpander::Beginning + 2 * LocalSlack) {
        return;
    }

    // Whole periods that end before the window cannot contribute; jump past
    // them without converting each candidate.
    const qint64 targetLocal = m_from - LocalSlack;
    const qint64 periodMillis = m_cadence.periodLengthDays * core::MillisPerDay;
    const qint64 firstStart = m_cadence.periodStartDay * core::MillisPerDay + m_cadence.timeOfDay;
    const qint64 skipPeriods = core::floorDiv(targetLocal - firstStart, periodMillis);
    if (skipPeriods > 0) {
        m_period = skipPeriods;
        m_slot = 0;
    }
}

std::optional<OccurrenceInstant> OccurrenceSequence::next()
{
    while (!m_done) {
        if (m_slot >= m_cadence.slotCount()) {
            ++m_period;
            m_slot = 0;
            continue;
        }

        const qint64 index = m_cadence.indexOf(m_period, m_slot);
        if (m_count && index >= *m_count) {
            m_done = true;
            break;
        }

        OccurrenceInstant occurrence;
        occurrence.index = index;
        occurrence.localStart = m_cadence.localStart(m_period, m_slot);
        occurrence.utcStart = m_resolver->toUtc(occurrence.localStart, m_zone);
        ++m_slot;

        if ((m_until && occurrence.utcStart > *m_until) || occurrence.utcStart >= m_to) {
            m_done = true;
            break;
        }
        if (occurrence.utcStart < m_from || m_exdates.contains(occurrence.utcStart)) {
            continue;
        }
        return occurrence;
    }
    return std::nullopt;
}

OccurrenceExpander::OccurrenceExpander(const TimeZoneResolver &resolver, RecurrenceRule rule, qint64 anchorLocal,
                                       ResolvedZone zone, ExdateSet exdates)
    : m_resolver(resolver)
    , m_rule(std::move(rule))
    , m_anchorLocal(anchorLocal)
    , m_zone(std::move(zone))
    , m_exdates(std::move(exdates))
    , m_cadence(cadenceFor(m_rule, anchorLocal))
{
}

OccurrenceSequence OccurrenceExpander::expand(qint64 fromUtc, qint64 toUtc) const
{
    return OccurrenceSequence(m_resolver, m_cadence, m_zone, m_rule.count, m_rule.until, m_exdates, fromUtc, toUtc);
}

OccurrenceSequence OccurrenceExpander::generated(qint64 fromUtc, qint64 toUtc) const
{
    return OccurrenceSequence(m_resolver, m_cadence, m_zone, m_rule.count, m_rule.until, ExdateSet(), fromUtc,
                              toUtc);
}

std::vector<qint64> OccurrenceExpander::collect(qint64 fromUtc, qint64 toUtc) const
{
    std::vector<qint64> result;
    OccurrenceSequence sequence = expand(fromUtc, toUtc);
    while (const auto occurrence = sequence.next()) {
        result.push_back(occurrence->utcStart);
    }
    return result;
}

std::optional<OccurrenceInstant> OccurrenceExpander::firstOccurrence() const
{
    OccurrenceSequence sequence = generated(Beginning, Unbounded);
    return sequence.next();
}

std::optional<OccurrenceInstant> OccurrenceExpander::lastOccurrence() const
{
    if (!m_rule.isBounded()) {
        return std::nullopt;
    }

    if (m_rule.count) {
        const qint64 index = *m_rule.count - 1;
        const qint64 firstPeriodCount = m_cadence.slotCount() - m_cadence.skippedInFirstPeriod;
        qint64 period = 0;
        qint64 slot = m_cadence.skippedInFirstPeriod + index;
        if (index >= firstPeriodCount) {
            const qint64 rest = index - firstPeriodCount;
            period = 1 + rest / m_cadence.slotCount();
            slot = rest % m_cadence.slotCount();
        }
        OccurrenceInstant last;
        last.index = index;
        last.localStart = m_cadence.localStart(period, slot);
        last.utcStart = m_resolver.toUtc(last.localStart, m_zone);
        if (!m_rule.until || last.utcStart <= *m_rule.until) {
            return last;
        }
    }

    // Bounded by UNTIL: every period holds at least one slot, so the last
    // occurrence lies within one period plus slack of the bound.
    const qint64 until = *m_rule.until;
    const qint64 lookBack = (m_cadence.periodLengthDays + 2) * core::MillisPerDay;
    const qint64 from = until > Beginning + lookBack ? until - lookBack : Beginning;
    const qint64 to = until < Unbounded ? until + 1 : Unbounded;
    OccurrenceSequence sequence = generated(from, to);
    std::optional<OccurrenceInstant> last;
    while (const auto occurrence = sequence.next()) {
        last = occurrence;
    }
    return last;
}

bool OccurrenceExpander::isOccurrence(qint64 utcMs) const
{
    if (utcMs == Unbounded) {
        return false;
    }
    OccurrenceSequence sequence = generated(utcMs, utcMs + 1);
    return sequence.next().has_value();
}

} // namespace engine
} // namespace timekeeping
