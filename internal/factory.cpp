#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/discovery/image_scanner.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/item_store.hpp"
#include "internal/taxonomy/taxonomy.hpp"
#include "internal/util/errors.hpp"
#if LABELQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LABELQ_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace labelq::factory {

using namespace labelq;

std::shared_ptr<db::Repository> BuildRepository(const labelq::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LABELQ_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode(),
                                                            static_cast<int>(database.sqlite().busy_timeout_ms()));
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    LABELQ_LOG_INFO("database ready", {observability::StringField("backend", "sqlite"),
                                       observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LABELQ_DB_POSTGRES
    db::postgres::PgRepository::BootstrapSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    LABELQ_LOG_INFO("database ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LABELQ_LOG_WARN("no database configured; using in-memory store, state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const labelq::runtime::config::RuntimeConfig& config, labelq::util::NowFn now) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  auto store  = std::make_shared<store::ItemStore>(app.repository, std::move(now));
  auto leases = std::make_shared<lease::LeaseManager>(store, labelq::util::FromProto(config.leases().reservation_timeout()));

  std::shared_ptr<discovery::ImageScanner> scanner;
  if (!config.images().directory().empty()) {
    std::vector<std::string> extensions(config.images().extensions().begin(), config.images().extensions().end());
    scanner = std::make_shared<discovery::ImageScanner>(store, config.images().directory(), extensions);
  }

  app.context.store           = store;
  app.context.leases          = leases;
  auto taxonomy = std::make_shared<const taxonomy::Taxonomy>(config);
  if (config.validation().strict_taxonomy() && taxonomy->Empty()) {
    throw util::InvalidState("validation.strict_taxonomy is set but no categories are configured");
  }

  app.context.taxonomy        = taxonomy;
  app.context.scanner         = scanner;
  app.context.url_prefix      = config.images().url_prefix();
  app.context.rescan_on_next  = config.images().rescan_on_next();
  app.context.strict_taxonomy = config.validation().strict_taxonomy();

  // ------------------------------------------------------------------
  // Start-up state
  // ------------------------------------------------------------------
  if (config.leases().release_on_startup()) {
    ReleaseReservations(app, "startup");
  }
  if (scanner) {
    scanner->Scan();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.queue_service = std::make_shared<service::QueueService>(app.context);
  app.admin_service = std::make_shared<service::AdminService>(app.context);

  return app;
}

uint64_t ReleaseReservations(const Application& app, const char* phase) {
  const auto released = app.context.store->ReleaseAll();
  LABELQ_LOG_INFO("reservations released", {observability::StringField("phase", phase),
                                            observability::IntField("released", static_cast<int64_t>(released))});
  return released;
}

} // namespace labelq::factory
