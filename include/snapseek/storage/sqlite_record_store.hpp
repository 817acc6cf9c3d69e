#pragma once

#include "snapseek/storage/record_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>

namespace snapseek::storage {

class SqliteRecordStore final : public IRecordStore {
public:
  /// Opens (creating if needed) the database and its schema.
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteRecordStore>>
  open(const std::filesystem::path &db_path);

  ~SqliteRecordStore() override;
  SqliteRecordStore(const SqliteRecordStore &) = delete;
  SqliteRecordStore &operator=(const SqliteRecordStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Status bind_vector_layout(const VectorLayout &layout) override;
  [[nodiscard]] common::Result<StoredItem> create_record(const NewRecord &record) override;
  [[nodiscard]] common::Result<std::vector<StoredItem>> list_all_records() override;
  [[nodiscard]] common::Result<std::vector<StoredItem>> list_records(std::size_t offset,
                                                                    std::size_t limit) override;
  [[nodiscard]] common::Result<std::optional<StoredItem>> get_record(std::int64_t id) override;
  [[nodiscard]] common::Result<bool> delete_record(std::int64_t id) override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] bool health_check() override;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  SqliteRecordStore(std::filesystem::path db_path, sqlite3 *db);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::string> meta_value(const std::string &key);
  [[nodiscard]] common::Status set_meta_value(const std::string &key, const std::string &value);
  [[nodiscard]] common::Result<std::size_t> count_locked();
  [[nodiscard]] common::Result<std::vector<StoredItem>> query_items(const std::string &sql,
                                                                   std::int64_t arg1,
                                                                   std::int64_t arg2);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace snapseek::storage
