#pragma once

#include <QMap>
#include <QString>
#include <optional>
#include <vector>

#include "timekeeping/data/Event.hpp"
#include "timekeeping/data/EventRecord.hpp"

namespace timekeeping {
namespace data {

// JSON document on disk: {"households": [...], "events": [...]}. Every
// mutation rewrites the whole file through QSaveFile, so a failed or
// interrupted write leaves the previous file in place.
class FileEventStorage
{
public:
    explicit FileEventStorage(QString filePath);
    ~FileEventStorage() = default;

    const QString &filePath() const { return m_filePath; }
    const QMap<QString, EventRecord> &events() const;
    const QMap<QString, Household> &households() const;

    /// Empty when the file could not be written; memory is left unchanged.
    std::optional<EventRecord> addOrUpdateEvent(EventRecord event);
    bool removeEvent(const QString &id);
    bool upsertHousehold(const Household &household);
    bool replaceEvents(const std::vector<EventRecord> &changed);

private:
    void load();
    bool save() const;

    QString m_filePath;
    QMap<QString, EventRecord> m_events;
    QMap<QString, Household> m_households;
};

} // namespace data
} // namespace timekeeping
