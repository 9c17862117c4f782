#include "timekeeping/core/Logging.hpp"

Q_LOGGING_CATEGORY(TIMEKEEPING_LOG, "timekeeping", QtInfoMsg)
Q_LOGGING_CATEGORY(TIMEKEEPING_QUERY_LOG, "timekeeping.query", QtWarningMsg)
Q_LOGGING_CATEGORY(TIMEKEEPING_BACKFILL_LOG, "timekeeping.backfill", QtInfoMsg)
Q_LOGGING_CATEGORY(TIMEKEEPING_DRIFT_LOG, "timekeeping.drift", QtInfoMsg)
