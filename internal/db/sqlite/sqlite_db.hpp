#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace workflow::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process. Transactions take TransactionMutex()
  for their whole lifetime, so in-process writers queue here and
  other processes queue on BEGIN IMMEDIATE + busy_timeout.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Pragmas and migrations; failures raise util::StoreUnavailable.
  void Exec(const std::string& sql);

  bool InMemory() const;

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  tx_mutex_;
};

} // namespace workflow::db::sqlite
