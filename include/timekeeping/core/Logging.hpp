#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(TIMEKEEPING_LOG)
Q_DECLARE_LOGGING_CATEGORY(TIMEKEEPING_QUERY_LOG)
Q_DECLARE_LOGGING_CATEGORY(TIMEKEEPING_BACKFILL_LOG)
Q_DECLARE_LOGGING_CATEGORY(TIMEKEEPING_DRIFT_LOG)
