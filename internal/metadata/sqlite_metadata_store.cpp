#include "sqlite_metadata_store.hpp"

#include "internal/util/time.hpp"

namespace skycache::metadata {

using namespace skycache::db::sqlite;

SqliteMetadataStore::SqliteMetadataStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("CREATE TABLE IF NOT EXISTS cache_metadata (key TEXT PRIMARY KEY, value TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);");
}

std::optional<std::string> SqliteMetadataStore::Get(const std::string& key) {
  auto st = db_->Prepare("SELECT value FROM cache_metadata WHERE key=?;");
  BindText(st.get(), 1, key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ColText(st.get(), 0);
}

void SqliteMetadataStore::Put(const std::string& key, const std::string& value) {
  auto st = db_->Prepare("INSERT OR REPLACE INTO cache_metadata(key, value, updated_at_ms) VALUES(?, ?, ?);");
  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  BindI64(st.get(), 3, static_cast<std::int64_t>(util::NowUnixMillis()));
  db_->StepDone(st.get(), "sqlite put metadata");
}

bool SqliteMetadataStore::Remove(const std::string& key) {
  auto st = db_->Prepare("DELETE FROM cache_metadata WHERE key=?;");
  BindText(st.get(), 1, key);
  db_->StepDone(st.get(), "sqlite remove metadata");
  return sqlite3_changes(db_->Handle()) > 0;
}

/*
  Prefix match with substr rather than LIKE so '_' and '%' in keys are
  taken literally.
*/
std::vector<std::string> SqliteMetadataStore::Keys(const std::string& prefix) {
  auto st = db_->Prepare("SELECT key FROM cache_metadata WHERE substr(key, 1, ?) = ? ORDER BY key;");
  BindI64(st.get(), 1, static_cast<std::int64_t>(prefix.size()));
  BindText(st.get(), 2, prefix);

  std::vector<std::string> keys;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  return keys;
}

} // namespace skycache::metadata
