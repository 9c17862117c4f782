#pragma once

#include <QString>
#include <atomic>
#include <functional>
#include <optional>
#include <vector>

#include "timekeeping/data/Event.hpp"
#include "timekeeping/data/EventRecord.hpp"
#include "timekeeping/engine/TimeZoneResolver.hpp"

namespace timekeeping {
namespace data {
class EventRepository;
}

namespace engine {
class TimeZoneDatabase;
}

namespace migration {

struct BackfillOptions
{
    // Empty runs over every household.
    std::optional<QString> householdId;
    int batchSize = 500;
    bool dryRun = false;
};

// Shared with the thread that may ask a running backfill to stop. The run
// checks it between batches.
class BackfillControl
{
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic_bool m_cancelled{ false };
};

struct BackfillProgress
{
    int scanned = 0;
    int updated = 0;
    int skipped = 0;
    int remaining = 0;
    int batches = 0;
};

enum class BackfillStatus
{
    Completed,
    Cancelled,
    Failed,
};

QString backfillStatusName(BackfillStatus status);

struct BackfillSkip
{
    QString eventId;
    QString reason;
};

struct BackfillSummary
{
    int scanned = 0;
    int updated = 0;
    int skipped = 0;
    int batches = 0;
    BackfillStatus status = BackfillStatus::Completed;
    std::vector<BackfillSkip> skipExamples;
};

struct RoundTripIssue
{
    QString eventId;
    QString problem;
};

struct RoundTripReport
{
    int checked = 0;
    std::vector<RoundTripIssue> issues;

    bool ok() const { return issues.empty(); }
};

// Rewrites legacy rows into the canonical epoch-millisecond schema and
// refreshes their first-occurrence UTC caches. Normalizing a canonical row
// yields the same row, so the run can be repeated or resumed freely.
class BackfillNormalizer
{
public:
    using ProgressCallback = std::function<void(const BackfillProgress &)>;

    static constexpr int MinBatchSize = 1;
    static constexpr int MaxBatchSize = 5000;
    static constexpr int MaxSkipExamples = 50;

    explicit BackfillNormalizer(const engine::TimeZoneDatabase &database);

    /// Canonical form of @p record, or empty when the row cannot be
    /// normalized; @p reason then says why.
    std::optional<data::EventRecord> normalize(const data::EventRecord &record,
                                               const std::optional<QString> &householdTz,
                                               QString *reason = nullptr) const;

    BackfillSummary run(data::EventRepository &repository, const BackfillOptions &options,
                        const BackfillControl *control = nullptr,
                        const ProgressCallback &progress = ProgressCallback()) const;

    /// Compares snapshots taken before and after a run.
    RoundTripReport verifyRoundTrip(const std::vector<data::EventRecord> &before,
                                    const std::vector<data::EventRecord> &after,
                                    const std::vector<data::Household> &households) const;

private:
    engine::TimeZoneResolver m_resolver;
};

} // namespace migration
} // namespace timekeeping
