#include "timekeeping/core/AppContext.hpp"

#include "timekeeping/data/DataProvider.hpp"
#include "timekeeping/data/EventRepository.hpp"
#include "timekeeping/engine/QueryEngine.hpp"
#include "timekeeping/engine/TimeZoneDatabase.hpp"
#include "timekeeping/engine/TimeZoneResolver.hpp"
#include "timekeeping/migration/BackfillNormalizer.hpp"
#include "timekeeping/migration/DriftDetector.hpp"

namespace timekeeping {
namespace core {

AppContext::AppContext(EngineSettings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.storagePath))
    , m_timeZoneDatabase(std::make_unique<engine::SystemTimeZoneDatabase>(m_settings.timeZoneDatabaseVersion))
    , m_resolver(std::make_unique<engine::TimeZoneResolver>(*m_timeZoneDatabase))
{
}

AppContext::~AppContext() = default;

data::EventRepository &AppContext::eventRepository()
{
    return m_dataProvider->eventRepository();
}

const engine::TimeZoneDatabase &AppContext::timeZoneDatabase() const
{
    return *m_timeZoneDatabase;
}

const engine::TimeZoneResolver &AppContext::resolver() const
{
    return *m_resolver;
}

engine::QueryEngine AppContext::queryEngine() const
{
    return engine::QueryEngine(*m_resolver, m_settings.maxQueryLimit);
}

migration::BackfillNormalizer AppContext::backfillNormalizer() const
{
    return migration::BackfillNormalizer(*m_timeZoneDatabase);
}

migration::DriftDetector AppContext::driftDetector() const
{
    return migration::DriftDetector(*m_timeZoneDatabase, m_settings.driftToleranceMs);
}

} // namespace core
} // namespace timekeeping
