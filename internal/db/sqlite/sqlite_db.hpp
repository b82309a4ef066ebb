#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace skycache::db::sqlite {

/*
  Owning handle for a prepared statement; finalized on scope exit.
*/
using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*
  Thin RAII wrapper around sqlite3*.

  The connection is opened FULLMUTEX so a single handle can be shared by
  the blob store and the metadata slot.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  // Prepare a statement owned by the returned handle
  StatementPtr Prepare(const std::string& sql);

  // Step a statement expected to produce no rows
  void StepDone(sqlite3_stmt* stmt, const char* what);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// ------------------------------------------------------------------
// Bind / column helpers
// ------------------------------------------------------------------

void BindText(sqlite3_stmt* st, int idx, const std::string& s);
void BindI64(sqlite3_stmt* st, int idx, std::int64_t v);
void BindBlob(sqlite3_stmt* st, int idx, const std::uint8_t* data, std::int64_t size);

std::string  ColText(sqlite3_stmt* st, int col);
std::int64_t ColI64(sqlite3_stmt* st, int col);

} // namespace skycache::db::sqlite
