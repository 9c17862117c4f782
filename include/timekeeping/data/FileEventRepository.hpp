#pragma once

#include "timekeeping/data/EventRepository.hpp"
#include "timekeeping/data/FileEventStorage.hpp"

#include <memory>

namespace timekeeping {
namespace data {

class FileEventRepository : public EventRepository
{
public:
    explicit FileEventRepository(std::shared_ptr<FileEventStorage> storage);
    ~FileEventRepository() override = default;

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

private:
    std::shared_ptr<FileEventStorage> m_storage;
};

} // namespace data
} // namespace timekeeping
