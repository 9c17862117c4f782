#pragma once

#include <memory>

#include "timekeeping/core/EngineSettings.hpp"

namespace timekeeping {
namespace data {
class DataProvider;
class EventRepository;
}

namespace engine {
class QueryEngine;
class TimeZoneDatabase;
class TimeZoneResolver;
}

namespace migration {
class BackfillNormalizer;
class DriftDetector;
}

namespace core {

// Owns the store, the timezone database and the services built on them for
// the lifetime of one command.
class AppContext
{
public:
    explicit AppContext(EngineSettings settings);
    ~AppContext();

    const EngineSettings &settings() const { return m_settings; }
    data::EventRepository &eventRepository();
    const engine::TimeZoneDatabase &timeZoneDatabase() const;
    const engine::TimeZoneResolver &resolver() const;

    engine::QueryEngine queryEngine() const;
    migration::BackfillNormalizer backfillNormalizer() const;
    migration::DriftDetector driftDetector() const;

private:
    EngineSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<engine::TimeZoneDatabase> m_timeZoneDatabase;
    std::unique_ptr<engine::TimeZoneResolver> m_resolver;
};

} // namespace core
} // namespace timekeeping
