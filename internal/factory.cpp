#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/action_queue.hpp"
#include "internal/core/audit_logger.hpp"
#include "internal/core/device_registry.hpp"
#include "internal/core/heartbeat_monitor.hpp"
#include "internal/core/ttl_reaper.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/agent_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reaper/reaper_worker.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/agent_service.hpp"
#if FLEET_HTTP_GATEWAY
#include "internal/http/http_gateway.hpp"
#endif
#if FLEET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if FLEET_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace fleet::factory {

service::ServiceContext BuildServiceContext(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                            const core::FleetPolicy& policy, const core::ReaperOptions& reaper_options) {
  service::ServiceContext ctx;
  ctx.audit     = std::make_shared<core::AuditLogger>(repository, clock, policy);
  ctx.registry  = std::make_shared<core::DeviceRegistry>(repository, clock, ctx.audit, policy);
  ctx.queue     = std::make_shared<core::ActionQueue>(repository, clock, ctx.audit, policy);
  ctx.heartbeat = std::make_shared<core::HeartbeatMonitor>(repository, clock, ctx.registry, ctx.queue, ctx.audit);
  ctx.reaper    = std::make_shared<core::TtlReaper>(repository, clock, ctx.audit, policy, reaper_options);
  return ctx;
}

std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLEET_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    FLEET_LOG_INFO("using sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLEET_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool);
    FLEET_LOG_INFO("using postgres store", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLEET_LOG_WARN("no database configured, using the in-memory store; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const fleet::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto policy         = config::ToFleetPolicy(config);
  const auto reaper_options = config::ToReaperOptions(config);

  // ------------------------------------------------------------------
  // Store + core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.context    = BuildServiceContext(app.repository, std::make_shared<util::SystemClock>(), policy, reaper_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto agent_service = std::make_shared<service::AgentService>(app.context);
  auto admin_service = std::make_shared<service::AdminService>(app.context);

  // ------------------------------------------------------------------
  // Transports
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AgentServer>(agent_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  if (config.server().http().enabled()) {
#if FLEET_HTTP_GATEWAY
    constexpr int kDefaultHttpPort = 8080;
    const auto&   http             = config.server().http();
    app.http_gateway = std::make_shared<http::HttpGateway>(http.host().empty() ? "0.0.0.0" : http.host(),
                                                           http.port() > 0 ? static_cast<int>(http.port()) : kDefaultHttpPort,
                                                           agent_service, admin_service);
#else
    throw std::runtime_error("HTTP gateway requested but not enabled at build time");
#endif
  }

  // ------------------------------------------------------------------
  // Reaper
  // ------------------------------------------------------------------
  if (reaper_options.enabled) {
    app.reaper_worker = std::make_shared<reaper::ReaperWorker>(app.context.reaper, reaper_options.interval);
  }

  return app;
}

} // namespace fleet::factory
