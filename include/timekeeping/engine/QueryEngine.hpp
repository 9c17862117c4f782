#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "timekeeping/data/Event.hpp"

namespace timekeeping {
namespace data {
class EventRepository;
}

namespace engine {

class TimeZoneResolver;

struct Occurrence
{
    QString eventId;
    qint64 startUtc = 0;
    qint64 endUtc = 0;
    bool recurring = false;

    bool operator==(const Occurrence &other) const;
    bool operator!=(const Occurrence &other) const { return !(*this == other); }
};

// Keyset position: the last item a caller has already seen.
struct OccurrenceCursor
{
    qint64 startUtc = 0;
    QString eventId;
};

struct OccurrenceQuery
{
    QString householdId;
    qint64 from = 0;
    qint64 to = 0;
    int limit = 100;
    std::optional<OccurrenceCursor> cursor;
    int offset = 0;
};

struct OccurrencePage
{
    std::vector<Occurrence> items;
    bool hasMore = false;
    std::optional<OccurrenceCursor> nextCursor;
};

// Household-scoped occurrence listing over [from, to). Items overlap the
// window and are ordered by start, then event id. Stateless apart from the
// borrowed resolver, so one engine may serve concurrent callers.
class QueryEngine
{
public:
    static constexpr int DefaultMaxLimit = 10000;

    explicit QueryEngine(const TimeZoneResolver &resolver, int maxLimit = DefaultMaxLimit);

    int maxLimit() const { return m_maxLimit; }
    int clampLimit(int limit) const;

    /// Throws E_RANGE_INVALID when from >= to. Only events of
    /// request.householdId take part. Events that fail to resolve are
    /// skipped with a warning.
    OccurrencePage query(const OccurrenceQuery &request, const std::vector<data::CalendarEvent> &events,
                         const std::optional<QString> &householdTz) const;
    /// Rows still in a legacy encoding are skipped until backfilled.
    OccurrencePage query(const OccurrenceQuery &request, const data::EventRepository &repository) const;

private:
    const TimeZoneResolver &m_resolver;
    int m_maxLimit;
};

} // namespace engine
} // namespace timekeeping
