#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <memory>

#include "version.h"

#include "timekeeping/core/AppContext.hpp"
#include "timekeeping/core/EngineSettings.hpp"
#include "timekeeping/core/Logging.hpp"
#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/core/WallClock.hpp"
#include "timekeeping/data/EventRepository.hpp"
#include "timekeeping/data/InMemoryEventRepository.hpp"
#include "timekeeping/engine/EventValidator.hpp"
#include "timekeeping/engine/QueryEngine.hpp"
#include "timekeeping/migration/BackfillNormalizer.hpp"
#include "timekeeping/migration/DriftDetector.hpp"

using namespace timekeeping;

namespace {

constexpr int ExitOk = 0;
constexpr int ExitFailure = 1;
constexpr int ExitFindings = 2;

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

// Accepts any ISO-8601 form; values without an offset are taken as UTC.
qint64 parseInstantOption(const QString &name, const QString &text)
{
    const auto parsed = core::parseIsoDateTime(text);
    if (!parsed) {
        throw core::TimeError(core::TimeErrorCode::RangeInvalid,
                              QStringLiteral("--%1 is not an ISO-8601 timestamp").arg(name), text);
    }
    return parsed->wallClock - parsed->offsetSeconds.value_or(0) * core::MillisPerSecond;
}

int parseCountOption(const QCommandLineParser &parser, const QString &name, int fallback)
{
    if (!parser.isSet(name)) {
        return fallback;
    }
    bool ok = false;
    const int value = parser.value(name).toInt(&ok);
    if (!ok) {
        err() << QStringLiteral("Ignoring non-numeric --%1 %2").arg(name, parser.value(name)) << Qt::endl;
        return fallback;
    }
    return value;
}

std::optional<QString> householdOption(const QCommandLineParser &parser)
{
    if (!parser.isSet(QStringLiteral("household"))) {
        return std::nullopt;
    }
    return parser.value(QStringLiteral("household"));
}

std::optional<QString> householdZone(const data::EventRepository &repository, const QString &householdId)
{
    if (const auto household = repository.findHousehold(householdId)) {
        return household->tz;
    }
    return std::nullopt;
}

int runQuery(core::AppContext &context, const QCommandLineParser &parser)
{
    const auto household = householdOption(parser);
    if (!household || !parser.isSet(QStringLiteral("from")) || !parser.isSet(QStringLiteral("to"))) {
        err() << "query needs --household, --from and --to" << Qt::endl;
        return ExitFailure;
    }

    engine::OccurrenceQuery request;
    request.householdId = *household;
    request.from = parseInstantOption(QStringLiteral("from"), parser.value(QStringLiteral("from")));
    request.to = parseInstantOption(QStringLiteral("to"), parser.value(QStringLiteral("to")));
    request.limit = parseCountOption(parser, QStringLiteral("limit"), request.limit);
    request.offset = parseCountOption(parser, QStringLiteral("offset"), 0);
    if (parser.isSet(QStringLiteral("after"))) {
        const QString cursor = parser.value(QStringLiteral("after"));
        const int separator = cursor.indexOf(QLatin1Char('/'));
        if (separator <= 0) {
            err() << "--after expects <start>/<event-id>" << Qt::endl;
            return ExitFailure;
        }
        request.cursor = engine::OccurrenceCursor{
            parseInstantOption(QStringLiteral("after"), cursor.left(separator)), cursor.mid(separator + 1)
        };
    }

    const engine::OccurrencePage page = context.queryEngine().query(request, context.eventRepository());
    for (const engine::Occurrence &occurrence : page.items) {
        out() << occurrence.eventId << '\t' << core::formatUtcInstant(occurrence.startUtc) << '\t'
              << core::formatUtcInstant(occurrence.endUtc) << (occurrence.recurring ? "\trecurring" : "")
              << Qt::endl;
    }
    if (page.nextCursor) {
        out() << "next: --after " << core::formatUtcInstant(page.nextCursor->startUtc) << '/'
              << page.nextCursor->eventId << Qt::endl;
    }
    return ExitOk;
}

int runValidate(core::AppContext &context, const QCommandLineParser &parser)
{
    data::EventRepository &repository = context.eventRepository();
    const engine::EventValidator validator(context.resolver());
    const auto household = householdOption(parser);
    const std::vector<data::EventRecord> rows =
        household ? repository.fetchEvents(*household) : repository.fetchAllEvents();

    int failures = 0;
    for (const data::EventRecord &record : rows) {
        const auto event = record.toCanonical();
        if (!event) {
            out() << record.id << "\tlegacy\trun backfill first" << Qt::endl;
            ++failures;
            continue;
        }
        try {
            const engine::ValidationReport report = validator.validate(*event, householdZone(repository, event->householdId));
            for (const qint64 instant : report.unmatchedExdates) {
                out() << record.id << "\twarning\texcluded date " << core::formatUtcInstant(instant)
                      << " matches no occurrence" << Qt::endl;
            }
            if (report.exdatesWithoutRule) {
                out() << record.id << "\twarning\texcluded dates without a recurrence rule" << Qt::endl;
            }
        } catch (const core::TimeError &error) {
            out() << record.id << '\t' << error.codeString() << '\t' << error.what() << Qt::endl;
            ++failures;
        }
    }
    out() << "Validated " << rows.size() << " events, " << failures << " failed" << Qt::endl;
    return failures == 0 ? ExitOk : ExitFailure;
}

void printSummary(const migration::BackfillSummary &summary)
{
    out() << "Status:  " << migration::backfillStatusName(summary.status) << Qt::endl;
    out() << "Scanned: " << summary.scanned << Qt::endl;
    out() << "Updated: " << summary.updated << Qt::endl;
    out() << "Skipped: " << summary.skipped << Qt::endl;
    out() << "Batches: " << summary.batches << Qt::endl;
    for (const migration::BackfillSkip &skip : summary.skipExamples) {
        out() << "  skipped " << skip.eventId << ": " << skip.reason << Qt::endl;
    }
}

int runBackfill(core::AppContext &context, const QCommandLineParser &parser)
{
    migration::BackfillOptions options;
    options.householdId = householdOption(parser);
    options.batchSize = parseCountOption(parser, QStringLiteral("batch-size"), context.settings().backfillBatchSize);
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));

    const migration::BackfillNormalizer normalizer = context.backfillNormalizer();
    const migration::BackfillSummary summary =
        normalizer.run(context.eventRepository(), options, nullptr, [](const migration::BackfillProgress &progress) {
            qCInfo(TIMEKEEPING_BACKFILL_LOG) << "Progress" << progress.scanned << "scanned," << progress.remaining
                                             << "remaining";
        });
    printSummary(summary);
    return summary.status == migration::BackfillStatus::Completed ? ExitOk : ExitFailure;
}

int runDriftCheck(core::AppContext &context, const QCommandLineParser &parser)
{
    const migration::DriftReport report = context.driftDetector().run(context.eventRepository(), householdOption(parser));
    out() << migration::formatHumanSummary(report);
    return report.hasDrift() ? ExitFindings : ExitOk;
}

// Normalizes a copy of the store in memory and checks the result; the store
// itself is left untouched.
int runRoundTripVerify(core::AppContext &context, const QCommandLineParser &parser)
{
    data::EventRepository &repository = context.eventRepository();
    data::InMemoryEventRepository scratch;
    for (const data::Household &household : repository.households()) {
        scratch.upsertHousehold(household);
    }
    for (const data::EventRecord &record : repository.fetchAllEvents()) {
        scratch.addEvent(record);
    }

    const auto household = householdOption(parser);
    const std::vector<data::EventRecord> before =
        household ? scratch.fetchEvents(*household) : scratch.fetchAllEvents();

    const migration::BackfillNormalizer normalizer = context.backfillNormalizer();
    migration::BackfillOptions options;
    options.householdId = household;
    options.batchSize = context.settings().backfillBatchSize;
    const migration::BackfillSummary summary = normalizer.run(scratch, options);
    printSummary(summary);

    const std::vector<data::EventRecord> after =
        household ? scratch.fetchEvents(*household) : scratch.fetchAllEvents();
    const migration::RoundTripReport report = normalizer.verifyRoundTrip(before, after, scratch.households());
    for (const migration::RoundTripIssue &issue : report.issues) {
        out() << issue.eventId << '\t' << issue.problem << Qt::endl;
    }
    out() << "Round trip " << (report.ok() ? "OK" : "FAILED") << " for " << report.checked << " rows" << Qt::endl;
    return report.ok() ? ExitOk : ExitFailure;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Timekeeping"));
    QCoreApplication::setApplicationName(QStringLiteral("tkctl"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTimekeepingVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Inspect and maintain recurring household events: query, validate, backfill, "
                       "drift-check, roundtrip-verify."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("query, validate, backfill, drift-check or roundtrip-verify."));
    parser.addOptions({
        { QStringLiteral("config"), QStringLiteral("INI file with engine settings."), QStringLiteral("file") },
        { QStringLiteral("store"), QStringLiteral("JSON event store to operate on."), QStringLiteral("file") },
        { QStringLiteral("household"), QStringLiteral("Restrict to one household."), QStringLiteral("id") },
        { QStringLiteral("from"), QStringLiteral("Window start (ISO-8601, UTC when no offset)."),
          QStringLiteral("instant") },
        { QStringLiteral("to"), QStringLiteral("Window end, exclusive."), QStringLiteral("instant") },
        { QStringLiteral("limit"), QStringLiteral("Page size."), QStringLiteral("n") },
        { QStringLiteral("offset"), QStringLiteral("Items to skip after the cursor."), QStringLiteral("n") },
        { QStringLiteral("after"), QStringLiteral("Continue after <start>/<event-id>."), QStringLiteral("cursor") },
        { QStringLiteral("batch-size"), QStringLiteral("Rows per backfill batch (1-5000)."), QStringLiteral("n") },
        { QStringLiteral("dry-run"), QStringLiteral("Report backfill changes without writing them.") },
        { QStringLiteral("tz-version"), QStringLiteral("Label of the timezone data in use."),
          QStringLiteral("version") },
    });
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(ExitFailure);
    }
    const QString command = positional.first();

    std::unique_ptr<QSettings> settingsStore = parser.isSet(QStringLiteral("config"))
        ? std::make_unique<QSettings>(parser.value(QStringLiteral("config")), QSettings::IniFormat)
        : std::make_unique<QSettings>();
    core::EngineSettings settings = core::EngineSettings::load(*settingsStore);
    if (parser.isSet(QStringLiteral("store"))) {
        settings.storagePath = parser.value(QStringLiteral("store"));
    }
    if (parser.isSet(QStringLiteral("tz-version"))) {
        settings.timeZoneDatabaseVersion = parser.value(QStringLiteral("tz-version"));
    }

    try {
        core::AppContext context(settings);
        if (command == QLatin1String("query")) {
            return runQuery(context, parser);
        }
        if (command == QLatin1String("validate")) {
            return runValidate(context, parser);
        }
        if (command == QLatin1String("backfill")) {
            return runBackfill(context, parser);
        }
        if (command == QLatin1String("drift-check")) {
            return runDriftCheck(context, parser);
        }
        if (command == QLatin1String("roundtrip-verify")) {
            return runRoundTripVerify(context, parser);
        }
    } catch (const core::TimeError &error) {
        err() << error.what() << Qt::endl;
        err() << core::timeErrorUserMessage(error.code()) << Qt::endl;
        return ExitFailure;
    }

    err() << "Unknown command: " << command << Qt::endl;
    parser.showHelp(ExitFailure);
}
