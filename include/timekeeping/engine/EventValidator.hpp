#pragma once

#include <QString>
#include <optional>
#include <vector>

namespace timekeeping {
namespace data {
struct CalendarEvent;
}

namespace engine {

class TimeZoneResolver;

// Soft findings that do not block a write.
struct ValidationReport
{
    // In range, but not equal to any generated occurrence; they exclude nothing.
    std::vector<qint64> unmatchedExdates;
    bool exdatesWithoutRule = false;

    bool isClean() const { return unmatchedExdates.empty() && !exdatesWithoutRule; }
};

// Authoring check run before an event is persisted.
class EventValidator
{
public:
    explicit EventValidator(const TimeZoneResolver &resolver);

    /// Throws the first core::TimeError the event violates.
    ValidationReport validate(const data::CalendarEvent &event, const std::optional<QString> &householdTz) const;

private:
    const TimeZoneResolver &m_resolver;
};

} // namespace engine
} // namespace timekeeping
