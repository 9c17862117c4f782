#include "timekeeping/core/EngineSettings.hpp"

#include "timekeeping/core/Logging.hpp"

#include <QSettings>

namespace timekeeping {
namespace core {

namespace {
constexpr auto StoragePathKey = "storage/path";
constexpr auto DatabaseVersionKey = "timezone/databaseVersion";
constexpr auto MaxQueryLimitKey = "query/maxLimit";
constexpr auto BatchSizeKey = "backfill/batchSize";
constexpr auto DriftToleranceKey = "drift/toleranceMs";

constexpr int MinBatchSize = 1;
constexpr int MaxBatchSize = 5000;
} // namespace

EngineSettings EngineSettings::load(const QSettings &settings)
{
    EngineSettings result;
    result.storagePath = settings.value(QLatin1String(StoragePathKey), result.storagePath).toString();
    result.timeZoneDatabaseVersion =
        settings.value(QLatin1String(DatabaseVersionKey), result.timeZoneDatabaseVersion).toString();

    bool ok = false;
    const int maxLimit = settings.value(QLatin1String(MaxQueryLimitKey), result.maxQueryLimit).toInt(&ok);
    if (ok && maxLimit > 0) {
        result.maxQueryLimit = maxLimit;
    } else {
        qCWarning(TIMEKEEPING_LOG) << "Ignoring invalid" << MaxQueryLimitKey
                                   << settings.value(QLatin1String(MaxQueryLimitKey));
    }

    const int batchSize = settings.value(QLatin1String(BatchSizeKey), result.backfillBatchSize).toInt(&ok);
    if (ok && batchSize >= MinBatchSize && batchSize <= MaxBatchSize) {
        result.backfillBatchSize = batchSize;
    } else {
        qCWarning(TIMEKEEPING_LOG) << "Ignoring invalid" << BatchSizeKey
                                   << settings.value(QLatin1String(BatchSizeKey));
    }

    const qint64 tolerance =
        settings.value(QLatin1String(DriftToleranceKey), result.driftToleranceMs).toLongLong(&ok);
    if (ok && tolerance >= 0) {
        result.driftToleranceMs = tolerance;
    } else {
        qCWarning(TIMEKEEPING_LOG) << "Ignoring invalid" << DriftToleranceKey
                                   << settings.value(QLatin1String(DriftToleranceKey));
    }
    return result;
}

void EngineSettings::save(QSettings &settings) const
{
    settings.setValue(QLatin1String(StoragePathKey), storagePath);
    settings.setValue(QLatin1String(DatabaseVersionKey), timeZoneDatabaseVersion);
    settings.setValue(QLatin1String(MaxQueryLimitKey), maxQueryLimit);
    settings.setValue(QLatin1String(BatchSizeKey), backfillBatchSize);
    settings.setValue(QLatin1String(DriftToleranceKey), driftToleranceMs);
}

} // namespace core
} // namespace timekeeping
