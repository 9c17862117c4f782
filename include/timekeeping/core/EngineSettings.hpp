#pragma once

#include <QString>
#include <QtGlobal>

class QSettings;

namespace timekeeping {
namespace core {

struct EngineSettings
{
    QString storagePath;
    QString timeZoneDatabaseVersion = QStringLiteral("system");
    int maxQueryLimit = 10000;
    int backfillBatchSize = 500;
    qint64 driftToleranceMs = 60 * 1000;

    static EngineSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace timekeeping
