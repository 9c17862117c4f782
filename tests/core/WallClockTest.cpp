#include <QtTest/QtTest>

#include "timekeeping/core/WallClock.hpp"

using namespace timekeeping::core;

class WallClockTest : public QObject
{
    Q_OBJECT

private slots:
    void convertsCalendarFields();
    void handlesValuesBeforeEpoch();
    void parsesExtendedForms();
    void parsesBasicUtcForm();
    void rejectsMalformedText_data();
    void rejectsMalformedText();
    void utcInstantNeedsZone();
    void formatsInstants();
};

void WallClockTest::convertsCalendarFields()
{
    const qint64 value = wallClockMs(QDate(2024, 3, 1), QTime(9, 0));
    QCOMPARE(value, Q_INT64_C(1709283600000));
    QCOMPARE(wallClockDate(value), QDate(2024, 3, 1));
    QCOMPARE(wallClockTime(value), QTime(9, 0));
    QCOMPARE(millisOfDay(value), 9 * 3600 * 1000);
}

void WallClockTest::handlesValuesBeforeEpoch()
{
    const qint64 value = wallClockMs(QDate(1969, 12, 31), QTime(23, 30));
    QCOMPARE(value, Q_INT64_C(-1800000));
    QCOMPARE(wallClockDate(value), QDate(1969, 12, 31));
    QCOMPARE(wallClockTime(value), QTime(23, 30));
    QCOMPARE(floorDiv(-1, 1000), Q_INT64_C(-1));
}

void WallClockTest::parsesExtendedForms()
{
    const auto dateOnly = parseIsoDateTime(QStringLiteral("2024-03-01"));
    QVERIFY(dateOnly.has_value());
    QVERIFY(!dateOnly->hasTime);
    QVERIFY(!dateOnly->offsetSeconds.has_value());
    QCOMPARE(dateOnly->wallClock, wallClockMs(QDate(2024, 3, 1)));

    const auto local = parseIsoDateTime(QStringLiteral("2024-03-01T09:15:30.5"));
    QVERIFY(local.has_value());
    QVERIFY(local->hasTime);
    QCOMPARE(local->wallClock, wallClockMs(QDate(2024, 3, 1), QTime(9, 15, 30, 500)));

    const auto offset = parseIsoDateTime(QStringLiteral("2024-03-01T09:00:00-05:00"));
    QVERIFY(offset.has_value());
    QCOMPARE(offset->offsetSeconds.value_or(0), -5 * 3600);

    const auto spaced = parseIsoDateTime(QStringLiteral("2024-03-01 09:00+0100"));
    QVERIFY(spaced.has_value());
    QCOMPARE(spaced->offsetSeconds.value_or(0), 3600);
}

void WallClockTest::parsesBasicUtcForm()
{
    const auto parsed = parseIsoDateTime(QStringLiteral("20240310T140000Z"));
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->wallClock, wallClockMs(QDate(2024, 3, 10), QTime(14, 0)));
    QCOMPARE(parsed->offsetSeconds.value_or(-1), 0);
}

void WallClockTest::rejectsMalformedText_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("empty") << QString();
    QTest::newRow("bad month") << QStringLiteral("2024-13-01");
    QTest::newRow("bad day") << QStringLiteral("2024-02-30T10:00:00Z");
    QTest::newRow("bad hour") << QStringLiteral("2024-02-01T25:00:00Z");
    QTest::newRow("offset without time") << QStringLiteral("2024-02-01Z");
    QTest::newRow("words") << QStringLiteral("next tuesday");
}

void WallClockTest::rejectsMalformedText()
{
    QFETCH(QString, text);
    QVERIFY(!parseIsoDateTime(text).has_value());
}

void WallClockTest::utcInstantNeedsZone()
{
    QVERIFY(parseUtcInstant(QStringLiteral("2024-03-05T14:00:00Z")).has_value());
    QVERIFY(parseUtcInstant(QStringLiteral("20240305T140000Z")).has_value());
    QVERIFY(!parseUtcInstant(QStringLiteral("2024-03-05T14:00:00")).has_value());
    QVERIFY(!parseUtcInstant(QStringLiteral("2024-03-05T14:00:00+00:00")).has_value());
    QVERIFY(!parseUtcInstant(QStringLiteral("2024-03-05")).has_value());
}

void WallClockTest::formatsInstants()
{
    const qint64 value = wallClockMs(QDate(2024, 3, 5), QTime(14, 0));
    QCOMPARE(formatUtcInstant(value), QStringLiteral("2024-03-05T14:00:00Z"));
    QCOMPARE(formatUtcInstant(value + 250), QStringLiteral("2024-03-05T14:00:00.250Z"));
    QCOMPARE(formatWallClock(value), QStringLiteral("2024-03-05T14:00:00"));
    QCOMPARE(parseUtcInstant(formatUtcInstant(value + 250)).value_or(0), value + 250);
}

QTEST_GUILESS_MAIN(WallClockTest)
#include "WallClockTest.moc"
