#include "factory.hpp"

#include <memory>

#include "internal/core/batch_writer.hpp"
#include "internal/core/geocoder.hpp"
#include "internal/core/location_resolver.hpp"
#include "internal/core/route_client.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/http/httplib_client.hpp"
#include "internal/observability/logging.hpp"

namespace commute::factory {

std::shared_ptr<db::Repository> BuildRepository(const commute::runtime::config::DatabaseConfig& database) {
  if (database.has_memory()) {
    COMMUTE_LOG_WARN("using in-memory storage; samples are discarded at exit");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  const auto& path = database.sqlite().path();
  {
    // schema connection is closed before any sampling transaction opens
    db::sqlite::SqliteDB sqlite_db(path);
    db::sqlite::BootstrapSchema(sqlite_db);
  }
  COMMUTE_LOG_DEBUG("sqlite schema ready", {observability::StringField("path", path)});
  return std::make_shared<db::sqlite::SqliteRepository>(path);
}

/*
    Build full application dependency graph
*/
Application Build(const commute::runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config.database());
  app.http       = std::make_shared<http::HttplibClient>();

  auto geocoder = std::make_shared<core::GoogleGeocoder>(config.provider(), app.http);
  auto resolver = std::make_shared<core::LocationResolver>(app.repository, std::move(geocoder));
  auto routes   = std::make_shared<core::GoogleRouteClient>(config.provider(), app.http);
  auto writer   = std::make_shared<core::BatchWriter>(app.repository);

  app.sampler = std::make_shared<core::CommuteSampler>(config, std::move(resolver), std::move(routes), std::move(writer));
  return app;
}

} // namespace commute::factory
