#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>
#include <memory>

#include "TestZones.hpp"
#include "timekeeping/data/FileEventRepository.hpp"
#include "timekeeping/data/FileEventStorage.hpp"
#include "timekeeping/data/InMemoryEventRepository.hpp"
#include "timekeeping/migration/BackfillNormalizer.hpp"

using namespace timekeeping;
using namespace timekeeping::migration;
using data::EventRecord;
using data::StoredTimestamp;
using testing::at;

Q_DECLARE_METATYPE(timekeeping::data::StoredTimestamp)

namespace {
const QString HouseholdId = QStringLiteral("hh-1");

EventRecord legacyRow(const QString &id, const StoredTimestamp &start, const StoredTimestamp &end = {})
{
    EventRecord record;
    record.id = id;
    record.householdId = HouseholdId;
    record.title = id;
    record.startAt = start;
    record.endAt = end;
    return record;
}

void seed(data::EventRepository &repository)
{
    repository.upsertHousehold(data::Household{ HouseholdId, QStringLiteral("America/New_York") });
    repository.addEvent(legacyRow(QStringLiteral("a-iso"), StoredTimestamp::iso(QStringLiteral("2024-03-01T09:00:00")),
                                  StoredTimestamp::iso(QStringLiteral("2024-03-01T10:00:00"))));
    repository.addEvent(legacyRow(QStringLiteral("b-seconds"), StoredTimestamp::seconds(1709283600)));

    EventRecord series = legacyRow(QStringLiteral("c-series"), StoredTimestamp::seconds(1709283600),
                                   StoredTimestamp::seconds(1709285400));
    series.rrule = QStringLiteral("FREQ=DAILY;COUNT=5");
    series.exdates = QStringLiteral("bogus,2024-03-03T14:00:00Z,2024-03-03T14:00:00Z");
    repository.addEvent(series);

    EventRecord martian = legacyRow(QStringLiteral("d-martian"), StoredTimestamp::seconds(1709283600));
    martian.tz = QStringLiteral("Mars/Olympus_Mons");
    repository.addEvent(martian);

    repository.addEvent(legacyRow(QStringLiteral("e-garbled"), StoredTimestamp::iso(QStringLiteral("next tuesday"))));
}
} // namespace

class BackfillNormalizerTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void decodesLegacyEncodings_data();
    void decodesLegacyEncodings();
    void normalizesRecurringRow();
    void keepsAllDayRowsFloating();
    void reportsWhyRowsAreSkipped();
    void normalizingTwiceChangesNothing();
    void runsInBatches();
    void dryRunLeavesStoreUntouched();
    void stopsWhenCancelled();
    void secondRunLeavesIdenticalFile();
    void verifiesRoundTrip();

private:
    std::unique_ptr<engine::InMemoryTimeZoneDatabase> m_database;
};

void BackfillNormalizerTest::init()
{
    m_database = std::make_unique<engine::InMemoryTimeZoneDatabase>(testing::pinnedZones());
}

void BackfillNormalizerTest::decodesLegacyEncodings_data()
{
    QTest::addColumn<StoredTimestamp>("start");

    QTest::newRow("iso local") << StoredTimestamp::iso(QStringLiteral("2024-03-01T09:00:00"));
    QTest::newRow("iso offset") << StoredTimestamp::iso(QStringLiteral("2024-03-01T14:00:00Z"));
    QTest::newRow("iso other offset") << StoredTimestamp::iso(QStringLiteral("2024-03-01T15:00:00+01:00"));
    QTest::newRow("seconds") << StoredTimestamp::seconds(1709283600);
    QTest::newRow("millis") << StoredTimestamp::millis(1709283600000);
}

void BackfillNormalizerTest::decodesLegacyEncodings()
{
    QFETCH(StoredTimestamp, start);

    const BackfillNormalizer normalizer(*m_database);
    const auto normalized = normalizer.normalize(legacyRow(QStringLiteral("evt"), start),
                                                 QStringLiteral("America/New_York"));
    QVERIFY(normalized.has_value());
    QVERIFY(normalized->startAt == StoredTimestamp::millis(at(2024, 3, 1, 9)));
    QVERIFY(normalized->startAtUtc == StoredTimestamp::millis(at(2024, 3, 1, 14)));
    QVERIFY(normalized->endAt.isMissing());
    QVERIFY(normalized->endAtUtc.isMissing());
    QVERIFY(normalized->toCanonical().has_value());
}

void BackfillNormalizerTest::normalizesRecurringRow()
{
    const BackfillNormalizer normalizer(*m_database);
    EventRecord row = legacyRow(QStringLiteral("gym"), StoredTimestamp::iso(QStringLiteral("2024-03-04T18:00")),
                                StoredTimestamp::iso(QStringLiteral("2024-03-04T19:30")));
    row.tz = QStringLiteral(" Europe/Berlin ");
    // Anchored on a Monday but only Wednesdays and Fridays recur.
    row.rrule = QStringLiteral("FREQ=WEEKLY;BYDAY=WE,FR;COUNT=4");
    row.exdates = QStringLiteral("2024-03-08T17:00:00Z,2024-01-01T00:00:00Z,2024-03-06T17:00:00");
    row.reminder = StoredTimestamp::iso(QStringLiteral("2024-03-06T17:30:00"));

    const auto normalized = normalizer.normalize(row, QStringLiteral("America/New_York"));
    QVERIFY(normalized.has_value());
    QCOMPARE(normalized->tz.value_or(QString()), QStringLiteral("Europe/Berlin"));
    QVERIFY(normalized->startAt == StoredTimestamp::millis(at(2024, 3, 4, 18)));
    QVERIFY(normalized->startAtUtc == StoredTimestamp::millis(at(2024, 3, 6, 17)));
    QVERIFY(normalized->endAtUtc == StoredTimestamp::millis(at(2024, 3, 6, 18, 30)));
    QVERIFY(normalized->reminder == StoredTimestamp::millis(at(2024, 3, 6, 16, 30)));
    QCOMPARE(normalized->exdates.value_or(QString()), QStringLiteral("2024-03-08T17:00:00Z"));
}

void BackfillNormalizerTest::keepsAllDayRowsFloating()
{
    const BackfillNormalizer normalizer(*m_database);
    const auto normalized = normalizer.normalize(
        legacyRow(QStringLiteral("holiday"), StoredTimestamp::iso(QStringLiteral("2024-07-04")),
                  StoredTimestamp::iso(QStringLiteral("2024-07-05"))),
        QStringLiteral("Asia/Tokyo"));
    QVERIFY(normalized.has_value());
    QVERIFY(normalized->startAt == StoredTimestamp::millis(at(2024, 7, 4)));
    QVERIFY(normalized->startAtUtc == StoredTimestamp::millis(at(2024, 7, 4)));
    QVERIFY(normalized->endAtUtc == StoredTimestamp::millis(at(2024, 7, 5)));
}

void BackfillNormalizerTest::reportsWhyRowsAreSkipped()
{
    const BackfillNormalizer normalizer(*m_database);
    QString reason;

    EventRecord martian = legacyRow(QStringLiteral("m"), StoredTimestamp::seconds(1709283600));
    martian.tz = QStringLiteral("Mars/Olympus_Mons");
    QVERIFY(!normalizer.normalize(martian, std::nullopt, &reason).has_value());
    QVERIFY(reason.contains(QStringLiteral("E_TZ_UNKNOWN")));

    QVERIFY(!normalizer.normalize(legacyRow(QStringLiteral("g"), StoredTimestamp::iso(QStringLiteral("soon"))),
                                  std::nullopt, &reason)
                 .has_value());
    QCOMPARE(reason, QStringLiteral("invalid start_at timestamp iso:soon"));

    QVERIFY(!normalizer.normalize(legacyRow(QStringLiteral("n"), StoredTimestamp()), std::nullopt, &reason)
                 .has_value());
    QCOMPARE(reason, QStringLiteral("missing start_at"));

    QVERIFY(!normalizer
                 .normalize(legacyRow(QStringLiteral("r"), StoredTimestamp::seconds(1709283600),
                                      StoredTimestamp::seconds(1709280000)),
                            std::nullopt, &reason)
                 .has_value());
    QCOMPARE(reason, QStringLiteral("end_at precedes start_at"));

    EventRecord monthly = legacyRow(QStringLiteral("y"), StoredTimestamp::seconds(1709283600));
    monthly.rrule = QStringLiteral("FREQ=MONTHLY");
    QVERIFY(!normalizer.normalize(monthly, std::nullopt, &reason).has_value());
    QVERIFY(reason.contains(QStringLiteral("E_RRULE_UNSUPPORTED_FIELD")));
}

void BackfillNormalizerTest::normalizingTwiceChangesNothing()
{
    const BackfillNormalizer normalizer(*m_database);
    data::InMemoryEventRepository repository;
    seed(repository);

    for (const EventRecord &row : repository.fetchAllEvents()) {
        const auto once = normalizer.normalize(row, QStringLiteral("America/New_York"));
        if (!once) {
            continue;
        }
        const auto twice = normalizer.normalize(*once, QStringLiteral("America/New_York"));
        QVERIFY(twice.has_value());
        QVERIFY(*twice == *once);
    }
}

void BackfillNormalizerTest::runsInBatches()
{
    const BackfillNormalizer normalizer(*m_database);
    data::InMemoryEventRepository repository;
    seed(repository);

    std::vector<BackfillProgress> reports;
    BackfillOptions options;
    options.batchSize = 2;
    const BackfillSummary summary = normalizer.run(repository, options, nullptr,
                                                   [&reports](const BackfillProgress &progress) {
                                                       reports.push_back(progress);
                                                   });

    QVERIFY(summary.status == BackfillStatus::Completed);
    QCOMPARE(summary.scanned, 5);
    QCOMPARE(summary.updated, 3);
    QCOMPARE(summary.skipped, 2);
    QCOMPARE(summary.batches, 3);
    QCOMPARE(repository.committedBatches(), 2);
    QCOMPARE(summary.skipExamples.size(), static_cast<size_t>(2));
    QCOMPARE(summary.skipExamples.front().eventId, QStringLiteral("d-martian"));

    QCOMPARE(reports.size(), static_cast<size_t>(3));
    QCOMPARE(reports.front().remaining, 3);
    QCOMPARE(reports.back().remaining, 0);

    const auto series = repository.findById(QStringLiteral("c-series"));
    QVERIFY(series.has_value());
    QVERIFY(series->startAt == StoredTimestamp::millis(at(2024, 3, 1, 9)));
    QVERIFY(series->endAtUtc == StoredTimestamp::millis(at(2024, 3, 1, 14, 30)));
    QCOMPARE(series->exdates.value_or(QString()), QStringLiteral("2024-03-03T14:00:00Z"));

    const auto martian = repository.findById(QStringLiteral("d-martian"));
    QVERIFY(martian->startAt == StoredTimestamp::seconds(1709283600));

    const BackfillSummary again = normalizer.run(repository, options);
    QCOMPARE(again.updated, 0);
    QCOMPARE(again.skipped, 2);
    QCOMPARE(repository.committedBatches(), 2);
}

void BackfillNormalizerTest::dryRunLeavesStoreUntouched()
{
    const BackfillNormalizer normalizer(*m_database);
    data::InMemoryEventRepository repository;
    seed(repository);
    const std::vector<EventRecord> before = repository.fetchAllEvents();

    BackfillOptions options;
    options.dryRun = true;
    options.batchSize = 0;
    const BackfillSummary summary = normalizer.run(repository, options);

    QCOMPARE(summary.updated, 3);
    QCOMPARE(summary.batches, 5);
    QCOMPARE(repository.committedBatches(), 0);
    QVERIFY(repository.fetchAllEvents() == before);
}

void BackfillNormalizerTest::stopsWhenCancelled()
{
    const BackfillNormalizer normalizer(*m_database);
    data::InMemoryEventRepository repository;
    seed(repository);

    BackfillControl control;
    BackfillOptions options;
    options.batchSize = 2;
    const BackfillSummary summary =
        normalizer.run(repository, options, &control, [&control](const BackfillProgress &) { control.cancel(); });

    QVERIFY(summary.status == BackfillStatus::Cancelled);
    QCOMPARE(backfillStatusName(summary.status), QStringLiteral("cancelled"));
    QCOMPARE(summary.batches, 1);
    QCOMPARE(summary.scanned, 2);
    QVERIFY(repository.findById(QStringLiteral("c-series"))->startAt == StoredTimestamp::seconds(1709283600));
}

void BackfillNormalizerTest::secondRunLeavesIdenticalFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("events.json"));
    const BackfillNormalizer normalizer(*m_database);

    data::FileEventRepository repository(std::make_shared<data::FileEventStorage>(path));
    seed(repository);
    QCOMPARE(normalizer.run(repository, BackfillOptions()).updated, 3);

    const auto readFile = [&path]() {
        QFile file(path);
        return file.open(QIODevice::ReadOnly) ? file.readAll() : QByteArray();
    };
    const QByteArray first = readFile();
    QVERIFY(!first.isEmpty());

    data::FileEventRepository reopened(std::make_shared<data::FileEventStorage>(path));
    QCOMPARE(normalizer.run(reopened, BackfillOptions()).updated, 0);
    QCOMPARE(readFile(), first);

    // Rewriting the same rows serializes to the same bytes.
    QVERIFY(reopened.commitBatch(reopened.fetchAllEvents()));
    QCOMPARE(readFile(), first);
}

void BackfillNormalizerTest::verifiesRoundTrip()
{
    const BackfillNormalizer normalizer(*m_database);
    data::InMemoryEventRepository repository;
    seed(repository);
    const std::vector<EventRecord> before = repository.fetchAllEvents();
    normalizer.run(repository, BackfillOptions());

    std::vector<EventRecord> after = repository.fetchAllEvents();
    const RoundTripReport clean = normalizer.verifyRoundTrip(before, after, repository.households());
    QVERIFY(clean.ok());
    QCOMPARE(clean.checked, 5);

    for (EventRecord &row : after) {
        if (row.id == QLatin1String("a-iso")) {
            row.startAtUtc = StoredTimestamp::millis(at(2024, 3, 1, 13));
        } else if (row.id == QLatin1String("d-martian")) {
            row.title = QStringLiteral("renamed");
        }
    }
    after.pop_back();

    const RoundTripReport broken = normalizer.verifyRoundTrip(before, after, repository.households());
    QVERIFY(!broken.ok());
    QStringList flagged;
    for (const RoundTripIssue &issue : broken.issues) {
        flagged << issue.eventId;
    }
    QVERIFY(flagged.contains(QStringLiteral("a-iso")));
    QVERIFY(flagged.contains(QStringLiteral("d-martian")));
    QVERIFY(flagged.contains(QStringLiteral("e-garbled")));
}

QTEST_GUILESS_MAIN(BackfillNormalizerTest)
#include "BackfillNormalizerTest.moc"
