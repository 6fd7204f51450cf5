#include "factory.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#if WORKFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if WORKFLOW_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace workflow::factory {

namespace {

constexpr int kDefaultMaxRetries       = 3;
constexpr int kDefaultBaseDelaySeconds = 300;
constexpr int kDefaultLeaseSeconds     = 300;
constexpr int kDefaultRecencySeconds   = 86400;

int OrDefault(int value, int fallback) {
  return value > 0 ? value : fallback;
}

#if WORKFLOW_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if WORKFLOW_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

// Pooled connections prepare statements against the schema, so the
// schema goes in first over a plain connection.
void BootstrapPostgresSchema(const std::string& connection_uri, uint64_t now_ms) {
  pqxx::connection    conn(connection_uri);
  pqxx::work          tx(conn);
  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresMigrations(), now_ms);
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config, uint64_t now_ms) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WORKFLOW_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(),
                                                            OrDefault(static_cast<int>(database.sqlite().busy_timeout_ms()), 5000));
    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteMigrations(), now_ms);
    WORKFLOW_LOG_INFO("sqlite store ready", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if WORKFLOW_DB_POSTGRES
    const auto& postgres = database.postgres();
    BootstrapPostgresSchema(postgres.connection_uri(), now_ms);
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(),
                                                       static_cast<std::size_t>(OrDefault(static_cast<int>(postgres.max_connections()), 16)));
    WORKFLOW_LOG_INFO("postgres store ready", {observability::IntField("max_connections", OrDefault(static_cast<int>(postgres.max_connections()), 16))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  WORKFLOW_LOG_INFO("in-memory store ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

void Bootstrap(const runtime::config::RuntimeConfig& config, const Runtime& runtime) {
  const auto& quota = config.quota();

  std::size_t seeded = 0;
  if (quota.seed_defaults()) seeded += runtime.quota->SeedDefaultLimits();

  for (const auto& limit : quota.default_limits()) {
    runtime.quota->UpsertLimit(limit.service_name(), limit.quota_type(), limit.limit_value(), limit.window_seconds(), !limit.inactive());
  }

  WORKFLOW_LOG_INFO("quota limits seeded", {observability::IntField("defaults_created", static_cast<std::int64_t>(seeded)),
                                           observability::IntField("configured", quota.default_limits_size())});
}

/*
    Build full application dependency graph
*/
Runtime Build(const runtime::config::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock) {
  Runtime runtime;
  runtime.clock = clock ? std::move(clock) : std::make_shared<util::WallClock>();

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config, runtime.clock->NowMillis());

  // ------------------------------------------------------------------
  // Components
  // ------------------------------------------------------------------
  quota::QuotaTracker::Options quota_options;
  quota_options.recency_window = std::chrono::seconds(OrDefault(static_cast<int>(config.quota().recency_window_seconds()), kDefaultRecencySeconds));

  retry::RetryScheduler::Options retry_options;
  retry_options.base_delay = std::chrono::seconds(OrDefault(static_cast<int>(config.retry().base_delay_seconds()), kDefaultBaseDelaySeconds));

  core::WorkflowManager::Options manager_options;
  manager_options.default_max_retries = OrDefault(static_cast<int>(config.retry().max_retries()), kDefaultMaxRetries);
  manager_options.lease_timeout       = std::chrono::seconds(OrDefault(static_cast<int>(config.leases().timeout_seconds()), kDefaultLeaseSeconds));

  runtime.emitter     = std::make_shared<events::EventEmitter>(runtime.repository, runtime.clock);
  runtime.engine      = std::make_shared<core::TransitionEngine>(runtime.repository, runtime.emitter, runtime.clock);
  runtime.leases      = std::make_shared<lease::LeaseManager>(runtime.repository, runtime.emitter, runtime.clock);
  runtime.quota       = std::make_shared<quota::QuotaTracker>(runtime.repository, runtime.clock, quota_options);
  runtime.deadletters = std::make_shared<deadletter::DeadLetterStore>(runtime.repository, runtime.clock);
  runtime.scheduler   = std::make_shared<retry::RetryScheduler>(runtime.repository, runtime.engine, runtime.leases, runtime.quota,
                                                              runtime.deadletters, runtime.emitter, runtime.clock, retry_options);
  runtime.manager     = std::make_shared<core::WorkflowManager>(runtime.repository, runtime.engine, runtime.leases, runtime.quota,
                                                            runtime.scheduler, runtime.deadletters, runtime.emitter, runtime.clock,
                                                            manager_options);
  runtime.views       = std::make_shared<views::WorkflowViews>(runtime.repository, runtime.clock);

  Bootstrap(config, runtime);
  return runtime;
}

} // namespace workflow::factory
