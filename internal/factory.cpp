#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/catalog/catalog_lookup.hpp"
#include "internal/core/admission_controller.hpp"
#include "internal/core/queue_reader.hpp"
#include "internal/core/request_state_machine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/request_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/queue_store.hpp"
#include "internal/session/session_resolver.hpp"
#if SONGQUEUE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SONGQUEUE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace songqueue::factory {

using songqueue::observability::StringField;

namespace {

#if SONGQUEUE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,name,active,max_requests_per_patron,queue_limit FROM venue LIMIT 1;");
  sqlite_db->Exec("SELECT id,venue_id,status,queue_position FROM song_request LIMIT 1;");
}
#endif

#if SONGQUEUE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,name,active,max_requests_per_patron,queue_limit FROM venue LIMIT 1;");
  tx.exec("SELECT id,venue_id,status,queue_position FROM song_request LIMIT 1;");
  tx.commit();
}
#endif

uint32_t OrDefault(uint32_t value, uint32_t fallback) {
  return value == 0 ? fallback : value;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const songqueue::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SONGQUEUE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }

    db::sqlite::SqliteDB::Options options;
    options.wal_mode = sqlite.wal_mode();
    if (sqlite.busy_timeout_ms() > 0) {
      options.busy_timeout_ms = sqlite.busy_timeout_ms();
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    BootstrapSqliteSchema(sqlite_db);
    SONGQUEUE_LOG_INFO("database ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SONGQUEUE_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), OrDefault(postgres.max_connections(), 8));
    BootstrapPostgresSchema(pool);
    SONGQUEUE_LOG_INFO("database ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SONGQUEUE_LOG_WARN("database ready", {StringField("backend", "memory"), StringField("note", "requests are lost on exit")});
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildContext(std::shared_ptr<db::Repository> repository, const songqueue::runtime::config::RuntimeConfig& config) {
  const auto& queue = config.queue();

  core::AdmissionOptions admission;
  admission.average_track_minutes = OrDefault(queue.average_track_minutes(), admission.average_track_minutes);

  core::QueueReaderOptions reader;
  reader.default_page_size    = OrDefault(queue.default_page_size(), reader.default_page_size);
  reader.max_page_size        = OrDefault(queue.max_page_size(), reader.max_page_size);
  reader.patron_history_limit = OrDefault(queue.patron_history_limit(), reader.patron_history_limit);
  if (reader.default_page_size > reader.max_page_size) {
    throw std::runtime_error("queue.default_page_size exceeds queue.max_page_size");
  }

  service::ServiceContext ctx;
  ctx.repository    = repository;
  ctx.catalog       = std::make_shared<catalog::CatalogLookup>(repository);
  ctx.sessions      = std::make_shared<session::SessionResolver>(repository);
  ctx.store         = std::make_shared<queue::QueueStore>(repository);
  ctx.admission     = std::make_shared<core::AdmissionController>(ctx.catalog, ctx.store, admission);
  ctx.state_machine = std::make_shared<core::RequestStateMachine>(ctx.store);
  ctx.reader        = std::make_shared<core::QueueReader>(repository, reader);
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const songqueue::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.context = BuildContext(BuildRepository(config), config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.request_service = std::make_shared<service::RequestService>(app.context);
  app.catalog_service = std::make_shared<service::CatalogService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RequestServer>(app.request_service));
  app.grpc_services.push_back(std::make_unique<grpc::CatalogServer>(app.catalog_service));

  return app;
}

} // namespace songqueue::factory
