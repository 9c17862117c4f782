#include "timekeeping/data/InMemoryEventRepository.hpp"

#include <QUuid>

namespace timekeeping {
namespace data {

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<EventRecord> InMemoryEventRepository::fetchEvents(const QString &householdId) const
{
    std::vector<EventRecord> events;
    for (const auto &event : m_events) {
        if (event.householdId != householdId) {
            continue;
        }
        events.push_back(event);
    }
    return events;
}

std::vector<EventRecord> InMemoryEventRepository::fetchAllEvents() const
{
    return std::vector<EventRecord>(m_events.cbegin(), m_events.cend());
}

std::optional<EventRecord> InMemoryEventRepository::findById(const QString &id) const
{
    if (m_events.contains(id)) {
        return m_events.value(id);
    }
    return std::nullopt;
}

std::optional<EventRecord> InMemoryEventRepository::addEvent(EventRecord event)
{
    if (event.id.isEmpty()) {
        event.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    m_events.insert(event.id, event);
    return event;
}

bool InMemoryEventRepository::updateEvent(const EventRecord &event)
{
    if (!m_events.contains(event.id)) {
        return false;
    }
    m_events.insert(event.id, event);
    return true;
}

bool InMemoryEventRepository::removeEvent(const QString &id)
{
    return m_events.remove(id) > 0;
}

std::vector<Household> InMemoryEventRepository::households() const
{
    return std::vector<Household>(m_households.cbegin(), m_households.cend());
}

std::optional<Household> InMemoryEventRepository::findHousehold(const QString &id) const
{
    if (m_households.contains(id)) {
        return m_households.value(id);
    }
    return std::nullopt;
}

void InMemoryEventRepository::upsertHousehold(const Household &household)
{
    m_households.insert(household.id, household);
}

bool InMemoryEventRepository::commitBatch(const std::vector<EventRecord> &changed)
{
    for (const auto &event : changed) {
        if (!m_events.contains(event.id)) {
            return false;
        }
    }
    for (const auto &event : changed) {
        m_events.insert(event.id, event);
    }
    ++m_committedBatches;
    return true;
}

} // namespace data
} // namespace timekeeping
