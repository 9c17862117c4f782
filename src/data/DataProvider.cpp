#include "timekeeping/data/DataProvider.hpp"

#include "timekeeping/core/Logging.hpp"
#include "timekeeping/data/FileEventRepository.hpp"
#include "timekeeping/data/FileEventStorage.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace timekeeping {
namespace data {

DataProvider::DataProvider(const QString &storagePath)
    : m_storagePath(storagePath.isEmpty() ? defaultStoragePath() : storagePath)
{
    QDir dir = QFileInfo(m_storagePath).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    qCDebug(TIMEKEEPING_LOG) << "Using event store" << m_storagePath;

    m_eventStorage = std::make_shared<FileEventStorage>(m_storagePath);
    m_eventRepository = std::make_unique<FileEventRepository>(m_eventStorage);
}

DataProvider::~DataProvider() = default;

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

QString DataProvider::defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/timekeeping");
    }
    return QDir(storageFolder).filePath(QStringLiteral("events.json"));
}

} // namespace data
} // namespace timekeeping
