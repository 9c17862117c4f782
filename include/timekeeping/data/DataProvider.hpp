#pragma once

#include <memory>
#include <QString>

namespace timekeeping {
namespace data {

class EventRepository;
class FileEventStorage;

class DataProvider
{
public:
    /// An empty @p storagePath selects events.json under the application
    /// data location.
    explicit DataProvider(const QString &storagePath = QString());
    ~DataProvider();

    const QString &storagePath() const { return m_storagePath; }
    EventRepository &eventRepository();

    static QString defaultStoragePath();

private:
    QString m_storagePath;
    std::shared_ptr<FileEventStorage> m_eventStorage;
    std::unique_ptr<EventRepository> m_eventRepository;
};

} // namespace data
} // namespace timekeeping
