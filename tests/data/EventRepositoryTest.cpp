#include <QtTest/QtTest>

#include "timekeeping/data/InMemoryEventRepository.hpp"

using namespace timekeeping::data;

class EventRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFetch();
    void updateAndRemove();
    void scopesByHousehold();
    void commitBatchIsAllOrNothing();
};

namespace {
EventRecord makeRecord(const QString &household, qint64 start)
{
    EventRecord record;
    record.householdId = household;
    record.title = QStringLiteral("Event");
    record.startAt = StoredTimestamp::millis(start);
    return record;
}
} // namespace

void EventRepositoryTest::addAndFetch()
{
    InMemoryEventRepository repo;
    const auto stored = repo.addEvent(makeRecord(QStringLiteral("hh-1"), 1000));

    QVERIFY(stored.has_value());
    QVERIFY(!stored->id.isEmpty());

    const auto list = repo.fetchEvents(QStringLiteral("hh-1"));
    QCOMPARE(list.size(), static_cast<size_t>(1));
    QCOMPARE(list.front().title, QStringLiteral("Event"));

    const auto fetched = repo.findById(stored->id);
    QVERIFY(fetched.has_value());
    QVERIFY(fetched->startAt == StoredTimestamp::millis(1000));
}

void EventRepositoryTest::updateAndRemove()
{
    InMemoryEventRepository repo;
    const EventRecord stored = *repo.addEvent(makeRecord(QStringLiteral("hh-1"), 1000));

    EventRecord toUpdate = stored;
    toUpdate.title = QStringLiteral("Updated");
    QVERIFY(repo.updateEvent(toUpdate));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->title, QStringLiteral("Updated"));

    QVERIFY(repo.removeEvent(stored.id));
    QVERIFY(!repo.findById(stored.id).has_value());
    QVERIFY(!repo.updateEvent(toUpdate));
}

void EventRepositoryTest::scopesByHousehold()
{
    InMemoryEventRepository repo;
    repo.upsertHousehold(Household{ QStringLiteral("hh-1"), QStringLiteral("Europe/Berlin") });
    repo.addEvent(makeRecord(QStringLiteral("hh-1"), 1000));
    repo.addEvent(makeRecord(QStringLiteral("hh-2"), 2000));

    QCOMPARE(repo.fetchEvents(QStringLiteral("hh-1")).size(), static_cast<size_t>(1));
    QCOMPARE(repo.fetchEvents(QStringLiteral("hh-3")).size(), static_cast<size_t>(0));
    QCOMPARE(repo.fetchAllEvents().size(), static_cast<size_t>(2));

    const auto household = repo.findHousehold(QStringLiteral("hh-1"));
    QVERIFY(household.has_value());
    QCOMPARE(household->tz.value_or(QString()), QStringLiteral("Europe/Berlin"));
    QVERIFY(!repo.findHousehold(QStringLiteral("hh-2")).has_value());
}

void EventRepositoryTest::commitBatchIsAllOrNothing()
{
    InMemoryEventRepository repo;
    EventRecord first = *repo.addEvent(makeRecord(QStringLiteral("hh-1"), 1000));
    EventRecord second = *repo.addEvent(makeRecord(QStringLiteral("hh-1"), 2000));

    first.title = QStringLiteral("Changed");
    EventRecord unknown = makeRecord(QStringLiteral("hh-1"), 3000);
    unknown.id = QStringLiteral("missing");
    QVERIFY(!repo.commitBatch({ first, unknown }));
    QCOMPARE(repo.findById(first.id)->title, QStringLiteral("Event"));
    QCOMPARE(repo.committedBatches(), 0);

    second.title = QStringLiteral("Changed too");
    QVERIFY(repo.commitBatch({ first, second }));
    QCOMPARE(repo.findById(first.id)->title, QStringLiteral("Changed"));
    QCOMPARE(repo.findById(second.id)->title, QStringLiteral("Changed too"));
    QCOMPARE(repo.committedBatches(), 1);
}

QTEST_GUILESS_MAIN(EventRepositoryTest)
#include "EventRepositoryTest.moc"
