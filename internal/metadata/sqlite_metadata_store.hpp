#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "metadata_store.hpp"

namespace skycache::metadata {

/*
  Metadata slot persisted in the cache database (table cache_metadata).
*/
class SqliteMetadataStore final : public MetadataStore {
 public:
  explicit SqliteMetadataStore(std::shared_ptr<db::sqlite::SqliteDB> db);

  std::optional<std::string> Get(const std::string& key) override;
  void                       Put(const std::string& key, const std::string& value) override;
  bool                       Remove(const std::string& key) override;
  std::vector<std::string>   Keys(const std::string& prefix = "") override;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace skycache::metadata
