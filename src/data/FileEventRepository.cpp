#include "timekeeping/data/FileEventRepository.hpp"

#include "timekeeping/core/Logging.hpp"

namespace timekeeping {
namespace data {

FileEventRepository::FileEventRepository(std::shared_ptr<FileEventStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<EventRecord> FileEventRepository::fetchEvents(const QString &householdId) const
{
    std::vector<EventRecord> result;
    if (!m_storage) {
        return result;
    }

    const auto &events = m_storage->events();
    for (auto it = events.constBegin(); it != events.constEnd(); ++it) {
        const auto &event = it.value();
        if (event.householdId != householdId) {
            continue;
        }
        result.push_back(event);
    }
    return result;
}

std::vector<EventRecord> FileEventRepository::fetchAllEvents() const
{
    if (!m_storage) {
        return {};
    }
    const auto &events = m_storage->events();
    return std::vector<EventRecord>(events.cbegin(), events.cend());
}

std::optional<EventRecord> FileEventRepository::findById(const QString &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &events = m_storage->events();
    if (events.contains(id)) {
        return events.value(id);
    }
    return std::nullopt;
}

std::optional<EventRecord> FileEventRepository::addEvent(EventRecord event)
{
    if (!m_storage) {
        return std::nullopt;
    }
    return m_storage->addOrUpdateEvent(std::move(event));
}

bool FileEventRepository::updateEvent(const EventRecord &event)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replaceEvents({ event });
}

bool FileEventRepository::removeEvent(const QString &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeEvent(id);
}

std::vector<Household> FileEventRepository::households() const
{
    if (!m_storage) {
        return {};
    }
    const auto &households = m_storage->households();
    return std::vector<Household>(households.cbegin(), households.cend());
}

std::optional<Household> FileEventRepository::findHousehold(const QString &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &households = m_storage->households();
    if (households.contains(id)) {
        return households.value(id);
    }
    return std::nullopt;
}

void FileEventRepository::upsertHousehold(const Household &household)
{
    if (!m_storage) {
        return;
    }
    if (!m_storage->upsertHousehold(household)) {
        qCWarning(TIMEKEEPING_LOG) << "Failed to persist household" << household.id;
    }
}

bool FileEventRepository::commitBatch(const std::vector<EventRecord> &changed)
{
    if (!m_storage) {
        return false;
    }
    if (changed.empty()) {
        return true;
    }
    return m_storage->replaceEvents(changed);
}

} // namespace data
} // namespace timekeeping
