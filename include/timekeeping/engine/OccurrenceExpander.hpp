#pragma once

#include <QtGlobal>
#include <limits>
#include <optional>
#include <vector>

#include "timekeeping/engine/ExdateSet.hpp"
#include "timekeeping/engine/RecurrenceRule.hpp"
#include "timekeeping/engine/TimeZoneResolver.hpp"

namespace timekeeping {
namespace engine {

struct OccurrenceInstant
{
    qint64 localStart = 0;
    qint64 utcStart = 0;
    // Position in the series counted from the anchor, excluded ones included.
    qint64 index = 0;
};

// Local calendar layout of a series: each period holds one candidate per
// slot offset, all at the anchor's time of day.
struct SeriesCadence
{
    qint64 periodStartDay = 0;
    qint64 periodLengthDays = 1;
    std::vector<qint64> slotOffsets;
    int skippedInFirstPeriod = 0;
    qint64 timeOfDay = 0;

    qint64 slotCount() const { return static_cast<qint64>(slotOffsets.size()); }
    qint64 indexOf(qint64 period, qint64 slot) const;
    qint64 localStart(qint64 period, qint64 slot) const;
};

// Lazy walk over one series restricted to [from, to). Holds its own copy of
// the series state; only the resolver is borrowed and must outlive it.
class OccurrenceSequence
{
public:
    std::optional<OccurrenceInstant> next();
    void reset();

private:
    friend class OccurrenceExpander;

    OccurrenceSequence(const TimeZoneResolver &resolver, SeriesCadence cadence, ResolvedZone zone,
                       std::optional<int> count, std::optional<qint64> until, ExdateSet exdates, qint64 from,
                       qint64 to);

    const TimeZoneResolver *m_resolver;
    SeriesCadence m_cadence;
    ResolvedZone m_zone;
    std::optional<int> m_count;
    std::optional<qint64> m_until;
    ExdateSet m_exdates;
    qint64 m_from;
    qint64 m_to;

    qint64 m_period = 0;
    qint64 m_slot = 0;
    bool m_done = false;
};

class OccurrenceExpander
{
public:
    static constexpr qint64 Unbounded = std::numeric_limits<qint64>::max();
    static constexpr qint64 Beginning = std::numeric_limits<qint64>::min();

    OccurrenceExpander(const TimeZoneResolver &resolver, RecurrenceRule rule, qint64 anchorLocal, ResolvedZone zone,
                       ExdateSet exdates = ExdateSet());

    const RecurrenceRule &rule() const { return m_rule; }
    const ResolvedZone &zone() const { return m_zone; }
    qint64 anchorLocal() const { return m_anchorLocal; }
    const ExdateSet &exdates() const { return m_exdates; }

    /// Occurrences with @p fromUtc <= start < @p toUtc, EXDATEs removed.
    OccurrenceSequence expand(qint64 fromUtc, qint64 toUtc) const;
    std::vector<qint64> collect(qint64 fromUtc, qint64 toUtc) const;

    // Bounds of the generated series, ignoring EXDATEs.
    std::optional<OccurrenceInstant> firstOccurrence() const;
    /// Empty for unbounded series and for series with no occurrence at all.
    std::optional<OccurrenceInstant> lastOccurrence() const;
    bool isOccurrence(qint64 utcMs) const;

private:
    OccurrenceSequence generated(qint64 fromUtc, qint64 toUtc) const;

    const TimeZoneResolver &m_resolver;
    RecurrenceRule m_rule;
    qint64 m_anchorLocal;
    ResolvedZone m_zone;
    ExdateSet m_exdates;
    SeriesCadence m_cadence;
};

} // namespace engine
} // namespace timekeeping
