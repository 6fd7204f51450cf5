#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace workflow::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

struct Migration {
  int                      version;
  std::string              description;
  std::vector<std::string> statements;
};

/*
  Schema for each dialect. Statements are idempotent
  (CREATE ... IF NOT EXISTS) so re-running on an existing database
  is harmless.
*/
std::vector<Migration> SqliteMigrations();
std::vector<Migration> PostgresMigrations();

/*
  Runs migrations in order and records each version in
  schema_migrations.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered, uint64_t now_ms);

} // namespace workflow::db::sql
