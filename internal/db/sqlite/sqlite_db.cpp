#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace workflow::db::sqlite {

namespace {

constexpr int kDefaultBusyTimeoutMs = 5000;

std::string Describe(sqlite3* db, int rc) {
  const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  return std::string(msg) + " (sqlite code " + std::to_string(db ? sqlite3_extended_errcode(db) : rc) + ")";
}

} // namespace

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms)
    : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms > 0 ? busy_timeout_ms : kDefaultBusyTimeoutMs) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = Describe(db_, rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

bool SqliteDB::InMemory() const {
  return path_.empty() || path_ == ":memory:";
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : Describe(db_, rc);
    sqlite3_free(err);
    throw util::StoreUnavailable("sqlite exec: " + msg);
  }
}

void SqliteDB::Configure() {
  const int rc = sqlite3_busy_timeout(db_, busy_timeout_ms_);
  if (rc != SQLITE_OK) throw util::StoreUnavailable("busy_timeout: " + Describe(db_, rc));

  // Other processes keep reading while a worker holds the write lock.
  // In-memory databases have no WAL.
  if (!InMemory()) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // Transitions, events and dead letters reference workflow_items.
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace workflow::db::sqlite
