#pragma once

#include <QMap>
#include <QString>
#include <optional>
#include <vector>

#include "timekeeping/core/TimeError.hpp"
#include "timekeeping/engine/TimeZoneResolver.hpp"

namespace timekeeping {
namespace data {
class EventRepository;
struct CalendarEvent;
}

namespace engine {
class TimeZoneDatabase;
}

namespace migration {

enum class DriftCategory
{
    TimedMismatch,
    AlldayBoundaryError,
    TzUnknown,
};

QString driftCategoryName(DriftCategory category);

struct DriftFinding
{
    core::TimeErrorCode code = core::TimeErrorCode::TimezoneDriftDetected;
    QString eventId;
    QString householdId;
    std::optional<qint64> storedStartUtc;
    std::optional<qint64> storedEndUtc;
    std::optional<qint64> recomputedStartUtc;
    std::optional<qint64> recomputedEndUtc;
    qint64 deltaMs = 0;
    DriftCategory category = DriftCategory::TimedMismatch;
};

struct DriftReport
{
    QString databaseVersion;
    int totalEvents = 0;
    std::vector<DriftFinding> findings;
    QMap<QString, int> countsByCategory;
    QMap<QString, int> countsByHousehold;

    bool hasDrift() const { return !findings.empty(); }
};

QString formatHumanSummary(const DriftReport &report);

// Recomputes cached first-occurrence instants against one timezone database
// release. Findings are advisory; rows are never modified.
class DriftDetector
{
public:
    static constexpr qint64 DefaultToleranceMs = 60 * 1000;

    explicit DriftDetector(const engine::TimeZoneDatabase &database, qint64 toleranceMs = DefaultToleranceMs);

    qint64 toleranceMs() const { return m_toleranceMs; }

    /// Empty when the caches agree with recomputation. Events without a
    /// start_at_utc cache have nothing to compare and yield nothing.
    std::optional<DriftFinding> evaluate(const data::CalendarEvent &event,
                                         const std::optional<QString> &householdTz) const;

    DriftReport run(const data::EventRepository &repository,
                    const std::optional<QString> &householdId = std::nullopt) const;

private:
    engine::TimeZoneResolver m_resolver;
    qint64 m_toleranceMs;
};

} // namespace migration
} // namespace timekeeping
