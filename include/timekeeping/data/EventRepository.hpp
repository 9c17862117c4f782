#pragma once

#include <optional>
#include <vector>

#include "timekeeping/data/Event.hpp"
#include "timekeeping/data/EventRecord.hpp"

namespace timekeeping {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    // Results are ordered by id.
    virtual std::vector<EventRecord> fetchEvents(const QString &householdId) const = 0;
    virtual std::vector<EventRecord> fetchAllEvents() const = 0;
    virtual std::optional<EventRecord> findById(const QString &id) const = 0;
    /// Assigns an id when @p event has none. Empty when the write fails.
    virtual std::optional<EventRecord> addEvent(EventRecord event) = 0;
    virtual bool updateEvent(const EventRecord &event) = 0;
    virtual bool removeEvent(const QString &id) = 0;

    virtual std::vector<Household> households() const = 0;
    virtual std::optional<Household> findHousehold(const QString &id) const = 0;
    virtual void upsertHousehold(const Household &household) = 0;

    /// Replaces every record in @p changed as one unit. Returns false and
    /// applies nothing when any id is unknown or the write fails.
    virtual bool commitBatch(const std::vector<EventRecord> &changed) = 0;
};

} // namespace data
} // namespace timekeeping
