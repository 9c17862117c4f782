#pragma once

#include <QMap>

#include "timekeeping/data/EventRepository.hpp"

namespace timekeeping {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<EventRecord> fetchEvents(const QString &householdId) const override;
    std::vector<EventRecord> fetchAllEvents() const override;
    std::optional<EventRecord> findById(const QString &id) const override;
    std::optional<EventRecord> addEvent(EventRecord event) override;
    bool updateEvent(const EventRecord &event) override;
    bool removeEvent(const QString &id) override;

    std::vector<Household> households() const override;
    std::optional<Household> findHousehold(const QString &id) const override;
    void upsertHousehold(const Household &household) override;

    bool commitBatch(const std::vector<EventRecord> &changed) override;

    int committedBatches() const { return m_committedBatches; }

private:
    QMap<QString, EventRecord> m_events;
    QMap<QString, Household> m_households;
    int m_committedBatches = 0;
};

} // namespace data
} // namespace timekeeping
