#include "timekeeping/data/FileEventStorage.hpp"

#include "timekeeping/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QUuid>

namespace timekeeping {
namespace data {

namespace {
constexpr auto HouseholdsKey = "households";
constexpr auto EventsKey = "events";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

Household householdFromJson(const QJsonObject &object)
{
    Household household;
    household.id = object.value(QLatin1String("id")).toString();
    const QJsonValue tz = object.value(QLatin1String("tz"));
    if (tz.isString() && !tz.toString().trimmed().isEmpty()) {
        household.tz = tz.toString();
    }
    return household;
}

QJsonObject householdToJson(const Household &household)
{
    QJsonObject object;
    object.insert(QLatin1String("id"), household.id);
    if (household.tz) {
        object.insert(QLatin1String("tz"), *household.tz);
    }
    return object;
}
} // namespace

FileEventStorage::FileEventStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QMap<QString, EventRecord> &FileEventStorage::events() const
{
    return m_events;
}

const QMap<QString, Household> &FileEventStorage::households() const
{
    return m_households;
}

std::optional<EventRecord> FileEventStorage::addOrUpdateEvent(EventRecord event)
{
    if (event.id.isEmpty()) {
        event.id = prepareUid(QUuid::createUuid());
    }
    const std::optional<EventRecord> previous =
        m_events.contains(event.id) ? std::optional<EventRecord>(m_events.value(event.id)) : std::nullopt;
    m_events.insert(event.id, event);
    if (!save()) {
        qCWarning(TIMEKEEPING_LOG) << "Failed to persist event" << event.id << "to" << m_filePath;
        if (previous) {
            m_events.insert(event.id, *previous);
        } else {
            m_events.remove(event.id);
        }
        return std::nullopt;
    }
    return event;
}

bool FileEventStorage::removeEvent(const QString &id)
{
    if (!m_events.contains(id)) {
        return false;
    }
    const EventRecord previous = m_events.take(id);
    if (!save()) {
        m_events.insert(id, previous);
        return false;
    }
    return true;
}

bool FileEventStorage::upsertHousehold(const Household &household)
{
    const auto previous = m_households.constFind(household.id);
    const bool existed = previous != m_households.constEnd();
    const Household before = existed ? previous.value() : Household{};
    m_households.insert(household.id, household);
    if (!save()) {
        if (existed) {
            m_households.insert(household.id, before);
        } else {
            m_households.remove(household.id);
        }
        return false;
    }
    return true;
}

bool FileEventStorage::replaceEvents(const std::vector<EventRecord> &changed)
{
    for (const auto &event : changed) {
        if (!m_events.contains(event.id)) {
            return false;
        }
    }
    const QMap<QString, EventRecord> snapshot = m_events;
    for (const auto &event : changed) {
        m_events.insert(event.id, event);
    }
    if (!save()) {
        m_events = snapshot;
        return false;
    }
    return true;
}

void FileEventStorage::load()
{
    m_events.clear();
    m_households.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(TIMEKEEPING_LOG) << "Cannot open event store" << m_filePath << file.errorString();
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(TIMEKEEPING_LOG) << "Event store" << m_filePath << "is not valid JSON:"
                                   << parseError.errorString();
        return;
    }

    const QJsonObject root = document.object();
    const QJsonArray households = root.value(QLatin1String(HouseholdsKey)).toArray();
    for (const QJsonValue &value : households) {
        const Household household = householdFromJson(value.toObject());
        if (household.id.isEmpty()) {
            continue;
        }
        m_households.insert(household.id, household);
    }

    const QJsonArray events = root.value(QLatin1String(EventsKey)).toArray();
    for (const QJsonValue &value : events) {
        EventRecord event = EventRecord::fromJson(value.toObject());
        if (event.id.isEmpty()) {
            event.id = prepareUid(QUuid::createUuid());
        }
        m_events.insert(event.id, event);
    }
}

bool FileEventStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    QJsonArray households;
    for (const Household &household : m_households) {
        households.append(householdToJson(household));
    }
    // QMap iteration keeps events ordered by id, so equal content always
    // serializes to identical bytes.
    QJsonArray events;
    for (const EventRecord &event : m_events) {
        events.append(event.toJson());
    }

    QJsonObject root;
    root.insert(QLatin1String(HouseholdsKey), households);
    root.insert(QLatin1String(EventsKey), events);

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return file.commit();
}

} // namespace data
} // namespace timekeeping
