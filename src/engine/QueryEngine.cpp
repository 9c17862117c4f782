#include "timekeeping/engine/QueryEngine.hpp"

#include "timekeeping/core/Logging.hpp"
#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/core/WallClock.hpp"
#include "timekeeping/data/EventRepository.hpp"
#include "timekeeping/engine/ExdateSet.hpp"
#include "timekeeping/engine/OccurrenceExpander.hpp"
#include "timekeeping/engine/RecurrenceRule.hpp"
#include "timekeeping/engine/TimeZoneResolver.hpp"

#include <algorithm>
#include <queue>

namespace timekeeping {
namespace engine {

namespace {
// Cached first-occurrence instants may be off by a zone offset; a day of
// slack keeps the pre-filter from dropping a series that does intersect.
constexpr qint64 PrefilterSlack = core::MillisPerDay;

bool precedes(const Occurrence &lhs, const Occurrence &rhs)
{
    if (lhs.startUtc != rhs.startUtc) {
        return lhs.startUtc < rhs.startUtc;
    }
    return lhs.eventId < rhs.eventId;
}

bool afterCursor(const Occurrence &occurrence, const OccurrenceCursor &cursor)
{
    if (occurrence.startUtc != cursor.startUtc) {
        return occurrence.startUtc > cursor.startUtc;
    }
    return occurrence.eventId > cursor.eventId;
}

// Zero-length items count when they start inside the window.
bool overlaps(const Occurrence &occurrence, qint64 from, qint64 to)
{
    if (occurrence.startUtc >= to) {
        return false;
    }
    return occurrence.endUtc > from || occurrence.startUtc >= from;
}

qint64 saturatingSub(qint64 value, qint64 amount)
{
    return value > OccurrenceExpander::Beginning + amount ? value - amount : OccurrenceExpander::Beginning;
}

qint64 saturatingAdd(qint64 value, qint64 amount)
{
    return value < OccurrenceExpander::Unbounded - amount ? value + amount : OccurrenceExpander::Unbounded;
}

// Ordered occurrences of one event inside the window.
class OccurrenceStream
{
public:
    static OccurrenceStream single(Occurrence occurrence)
    {
        OccurrenceStream stream;
        stream.m_single = std::move(occurrence);
        return stream;
    }

    static OccurrenceStream series(const QString &eventId, const TimeZoneResolver &resolver,
                                   const OccurrenceExpander &expander, qint64 duration, qint64 from, qint64 to)
    {
        OccurrenceStream stream;
        stream.m_eventId = eventId;
        stream.m_resolver = &resolver;
        stream.m_zone = expander.zone();
        stream.m_duration = duration;
        stream.m_from = from;
        stream.m_to = to;
        // An occurrence starting before the window still overlaps it while
        // it runs, so the walk starts one duration early.
        stream.m_sequence = expander.expand(saturatingSub(from, duration + PrefilterSlack), to);
        return stream;
    }

    std::optional<Occurrence> pull()
    {
        if (!m_sequence) {
            std::optional<Occurrence> result = std::move(m_single);
            m_single.reset();
            return result;
        }
        while (const auto instant = m_sequence->next()) {
            Occurrence occurrence;
            occurrence.eventId = m_eventId;
            occurrence.startUtc = instant->utcStart;
            occurrence.endUtc = m_resolver->toUtc(instant->localStart + m_duration, *m_zone);
            occurrence.recurring = true;
            if (overlaps(occurrence, m_from, m_to)) {
                return occurrence;
            }
        }
        return std::nullopt;
    }

private:
    OccurrenceStream() = default;

    std::optional<Occurrence> m_single;
    QString m_eventId;
    const TimeZoneResolver *m_resolver = nullptr;
    std::optional<ResolvedZone> m_zone;
    std::optional<OccurrenceSequence> m_sequence;
    qint64 m_duration = 0;
    qint64 m_from = 0;
    qint64 m_to = 0;
};

struct StreamHead
{
    Occurrence occurrence;
    size_t stream = 0;
};

struct LaterHead
{
    bool operator()(const StreamHead &lhs, const StreamHead &rhs) const
    {
        return precedes(rhs.occurrence, lhs.occurrence);
    }
};
} // namespace

bool Occurrence::operator==(const Occurrence &other) const
{
    return eventId == other.eventId && startUtc == other.startUtc && endUtc == other.endUtc
        && recurring == other.recurring;
}

QueryEngine::QueryEngine(const TimeZoneResolver &resolver, int maxLimit)
    : m_resolver(resolver)
    , m_maxLimit(std::max(1, maxLimit))
{
}

int QueryEngine::clampLimit(int limit) const
{
    return std::clamp(limit, 1, m_maxLimit);
}

OccurrencePage QueryEngine::query(const OccurrenceQuery &request, const std::vector<data::CalendarEvent> &events,
                                  const std::optional<QString> &householdTz) const
{
    if (request.from >= request.to) {
        throw core::TimeError(core::TimeErrorCode::RangeInvalid,
                              QStringLiteral("window [%1, %2) is empty")
                                  .arg(core::formatUtcInstant(request.from), core::formatUtcInstant(request.to)));
    }

    std::vector<OccurrenceStream> streams;
    streams.reserve(events.size());
    for (const data::CalendarEvent &event : events) {
        if (event.householdId != request.householdId) {
            continue;
        }
        try {
            const ResolvedZone zone = m_resolver.resolve(event, householdTz);
            if (!event.isRecurring()) {
                Occurrence occurrence;
                occurrence.eventId = event.id;
                occurrence.startUtc = m_resolver.toUtc(event.startAt, zone);
                occurrence.endUtc = m_resolver.toUtc(event.startAt + event.wallClockDuration(), zone);
                if (overlaps(occurrence, request.from, request.to)) {
                    streams.push_back(OccurrenceStream::single(std::move(occurrence)));
                }
                continue;
            }

            if (event.startAtUtc && *event.startAtUtc > saturatingAdd(request.to, PrefilterSlack)) {
                continue;
            }
            const ExdateSet exdates = event.exdates ? ExdateSet::parse(*event.exdates) : ExdateSet();
            const OccurrenceExpander expander(m_resolver, parseRecurrenceRule(*event.rrule), event.startAt, zone,
                                              exdates);
            streams.push_back(OccurrenceStream::series(event.id, m_resolver, expander, event.wallClockDuration(),
                                                       request.from, request.to));
        } catch (const core::TimeError &error) {
            qCWarning(TIMEKEEPING_QUERY_LOG) << "Skipping event" << event.id << error.what();
        }
    }

    std::priority_queue<StreamHead, std::vector<StreamHead>, LaterHead> heads;
    for (size_t i = 0; i < streams.size(); ++i) {
        if (auto occurrence = streams[i].pull()) {
            heads.push(StreamHead{ std::move(*occurrence), i });
        }
    }

    const int limit = clampLimit(request.limit);
    int toSkip = std::max(0, request.offset);
    OccurrencePage page;
    while (!heads.empty()) {
        StreamHead head = heads.top();
        heads.pop();
        if (auto following = streams[head.stream].pull()) {
            heads.push(StreamHead{ std::move(*following), head.stream });
        }

        if (request.cursor && !afterCursor(head.occurrence, *request.cursor)) {
            continue;
        }
        if (toSkip > 0) {
            --toSkip;
            continue;
        }
        if (static_cast<int>(page.items.size()) == limit) {
            page.hasMore = true;
            break;
        }
        page.items.push_back(std::move(head.occurrence));
    }

    if (page.hasMore) {
        const Occurrence &last = page.items.back();
        page.nextCursor = OccurrenceCursor{ last.startUtc, last.eventId };
    }
    qCDebug(TIMEKEEPING_QUERY_LOG) << "Query" << request.householdId << "returned" << page.items.size()
                                   << "items from" << streams.size() << "events";
    return page;
}

OccurrencePage QueryEngine::query(const OccurrenceQuery &request, const data::EventRepository &repository) const
{
    std::vector<data::CalendarEvent> events;
    for (const data::EventRecord &record : repository.fetchEvents(request.householdId)) {
        if (auto event = record.toCanonical()) {
            events.push_back(std::move(*event));
        } else {
            qCWarning(TIMEKEEPING_QUERY_LOG) << "Skipping event" << record.id << "with legacy timestamps";
        }
    }
    std::optional<QString> householdTz;
    if (const auto household = repository.findHousehold(request.householdId)) {
        householdTz = household->tz;
    }
    return query(request, events, householdTz);
}

} // namespace engine
} // namespace timekeeping
