#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_validator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/result_cache.hpp"
#if POWERSCORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if POWERSCORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace powerscore::factory {

namespace cfg = powerscore::runtime::config;

std::shared_ptr<db::Repository> BuildRepository(const cfg::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if POWERSCORE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    POWERSCORE_LOG_INFO("Opened sqlite database", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if POWERSCORE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 4u : database.postgres().max_connections();
    auto       pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    POWERSCORE_LOG_INFO("Connected to postgres", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  POWERSCORE_LOG_WARN("Using in-memory repository; results are not persisted");
  return std::make_shared<db::memory::MemoryRepository>();
}

pipeline::PipelineSettings BuildPipelineSettings(const cfg::RuntimeConfig& config) {
  pipeline::PipelineSettings settings;
  settings.rating = config::ConfigValidator::BuildSettings(config);

  const auto& h                            = config.history();
  settings.history.snapshot_retention_days = h.snapshot_retention_days();
  settings.history.lookup_tolerance_days   = h.lookup_tolerance_days();
  settings.history.snapshot_batch_size     = h.snapshot_batch_size();

  const auto& w                      = config.writer();
  settings.writer.batch_size         = w.batch_size();
  settings.writer.max_retries        = w.max_retries();
  settings.writer.initial_backoff_ms = w.initial_backoff_ms();
  settings.writer.backoff_multiplier = w.backoff_multiplier();
  settings.writer.max_backoff_ms     = w.max_backoff_ms();

  settings.cache_enabled       = config.cache().enabled();
  settings.provider_filter     = config.ingest().provider_filter();
  settings.worker_threads      = config.workers().threads();
  settings.rating_config_bytes = pipeline::ResultCache::DeterministicBytes(config.rating());
  return settings;
}

Application Build(const cfg::RuntimeConfig& config) {
  Application app;
  // Validation runs here, so a bad config never opens the database.
  app.settings   = BuildPipelineSettings(config);
  app.repository = BuildRepository(config);
  return app;
}

} // namespace powerscore::factory
