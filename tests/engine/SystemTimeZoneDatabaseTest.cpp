#include <QtTest/QtTest>

#include "TestZones.hpp"
#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/engine/OccurrenceExpander.hpp"
#include "timekeeping/engine/TimeZoneDatabase.hpp"
#include "timekeeping/engine/TimeZoneResolver.hpp"

using namespace timekeeping;
using namespace timekeeping::engine;
using testing::at;

class SystemTimeZoneDatabaseTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void knowsHostZones();
    void readsHostOffsets();
    void dailySeriesFollowsHostDaylightSaving();
    void hostGapMovesToTransition();

private:
    SystemTimeZoneDatabase m_database { QStringLiteral("host") };
};

void SystemTimeZoneDatabaseTest::initTestCase()
{
    if (!m_database.contains(QStringLiteral("America/New_York"))) {
        QSKIP("host has no IANA timezone data");
    }
}

void SystemTimeZoneDatabaseTest::knowsHostZones()
{
    QCOMPARE(m_database.version(), QStringLiteral("host"));
    QVERIFY(m_database.contains(QStringLiteral("Europe/Berlin")));
    QVERIFY(!m_database.contains(QStringLiteral("Not/AZone")));
    QCOMPARE(m_database.offsetFromUtc(QStringLiteral("Not/AZone"), at(2024, 3, 1)), 0);

    const TimeZoneResolver resolver(m_database);
    QVERIFY_EXCEPTION_THROWN(resolver.resolve(QStringLiteral("Not/AZone"), std::nullopt), core::TimeError);
}

void SystemTimeZoneDatabaseTest::readsHostOffsets()
{
    const QString newYork = QStringLiteral("America/New_York");
    QCOMPARE(m_database.offsetFromUtc(newYork, at(2024, 3, 1, 14)), testing::EasternStandard);
    QCOMPARE(m_database.offsetFromUtc(newYork, at(2024, 3, 10, 6, 59)), testing::EasternStandard);
    QCOMPARE(m_database.offsetFromUtc(newYork, at(2024, 3, 10, 7)), testing::EasternDaylight);
    QCOMPARE(m_database.offsetFromUtc(QStringLiteral("Asia/Tokyo"), at(2024, 7, 1)), 9 * 3600);
}

void SystemTimeZoneDatabaseTest::dailySeriesFollowsHostDaylightSaving()
{
    const TimeZoneResolver resolver(m_database);
    const OccurrenceExpander series(resolver, parseRecurrenceRule(QStringLiteral("FREQ=DAILY;INTERVAL=1;COUNT=5")),
                                    at(2024, 3, 8, 9),
                                    resolver.resolveZoneId(QStringLiteral("America/New_York"),
                                                           ResolvedZone::Source::Event));
    const std::vector<qint64> expected { at(2024, 3, 8, 14), at(2024, 3, 9, 14), at(2024, 3, 10, 13),
                                         at(2024, 3, 11, 13), at(2024, 3, 12, 13) };
    QVERIFY(series.collect(OccurrenceExpander::Beginning, OccurrenceExpander::Unbounded) == expected);
}

void SystemTimeZoneDatabaseTest::hostGapMovesToTransition()
{
    const TimeZoneResolver resolver(m_database);
    const ResolvedZone newYork = resolver.resolveZoneId(QStringLiteral("America/New_York"),
                                                        ResolvedZone::Source::Event);
    QCOMPARE(resolver.toUtc(at(2024, 3, 10, 2, 30), newYork), at(2024, 3, 10, 7));
    QCOMPARE(resolver.toUtc(at(2024, 11, 3, 1, 30), newYork), at(2024, 11, 3, 5, 30));
}

QTEST_GUILESS_MAIN(SystemTimeZoneDatabaseTest)
#include "SystemTimeZoneDatabaseTest.moc"
