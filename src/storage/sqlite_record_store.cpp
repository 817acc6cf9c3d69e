#include "snapseek/storage/sqlite_record_store.hpp"

#include "snapseek/observability/global.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace snapseek::storage {

namespace {

constexpr const char *kItemColumns =
    "id, filename, original_filename, caption, embedding, file_path, file_size, content_type, "
    "upload_time";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorKind::Storage, msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

std::string column_blob(sqlite3_stmt *stmt, const int column) {
  const void *blob = sqlite3_column_blob(stmt, column);
  const int bytes = sqlite3_column_bytes(stmt, column);
  if (blob == nullptr || bytes <= 0) {
    return {};
  }
  return std::string(static_cast<const char *>(blob), static_cast<std::size_t>(bytes));
}

StoredItem row_to_item(sqlite3_stmt *stmt) {
  StoredItem item;
  item.id = sqlite3_column_int64(stmt, 0);
  item.filename = column_text(stmt, 1);
  item.original_filename = column_text(stmt, 2);
  item.caption = column_text(stmt, 3);
  item.vector_blob = column_blob(stmt, 4);
  item.file_path = column_text(stmt, 5);
  item.size_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 6));
  item.content_type = column_text(stmt, 7);
  item.created_at = column_text(stmt, 8);
  return item;
}

} // namespace

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

common::Result<std::unique_ptr<SqliteRecordStore>>
SqliteRecordStore::open(const std::filesystem::path &db_path) {
  using StoreResult = common::Result<std::unique_ptr<SqliteRecordStore>>;

  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return StoreResult::failure(common::ErrorKind::Storage,
                                  "failed to create " + db_path.parent_path().string() + ": " +
                                      ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string msg = db == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return StoreResult::failure(common::ErrorKind::Storage,
                                "cannot open " + db_path.string() + ": " + msg);
  }

  std::unique_ptr<SqliteRecordStore> store(new SqliteRecordStore(db_path, db));
  if (auto status = store->init_schema(); !status.ok()) {
    return StoreResult::failure(status.kind(), status.error());
  }
  return StoreResult::success(std::move(store));
}

SqliteRecordStore::SqliteRecordStore(std::filesystem::path db_path, sqlite3 *db)
    : db_path_(std::move(db_path)), db_(db) {}

SqliteRecordStore::~SqliteRecordStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteRecordStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS images (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  filename TEXT NOT NULL,
  original_filename TEXT NOT NULL,
  caption TEXT NOT NULL,
  embedding BLOB NOT NULL,
  file_path TEXT NOT NULL,
  file_size INTEGER NOT NULL,
  content_type TEXT NOT NULL,
  upload_time TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_images_upload_time ON images(upload_time);");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS collection_meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
)");
}

common::Result<std::string> SqliteRecordStore::meta_value(const std::string &key) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM collection_meta WHERE key = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::string>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  std::string value;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    value = column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<std::string>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return common::Result<std::string>::success(std::move(value));
}

common::Status SqliteRecordStore::set_meta_value(const std::string &key, const std::string &value) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO collection_meta(key, value) VALUES(?1, ?2) "
                    "ON CONFLICT(key) DO UPDATE SET value = excluded.value";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteRecordStore::bind_vector_layout(const VectorLayout &layout) {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string dimensions = std::to_string(layout.dimensions);
  const std::string element_size = std::to_string(layout.element_size);

  auto stored_dimensions = meta_value("vector_dimensions");
  auto stored_element_size = meta_value("vector_element_size");
  auto stored_embedder = meta_value("embedder");
  if (!stored_dimensions.ok()) {
    return common::Status::error(stored_dimensions.kind(), stored_dimensions.error());
  }
  if (!stored_element_size.ok()) {
    return common::Status::error(stored_element_size.kind(), stored_element_size.error());
  }
  if (!stored_embedder.ok()) {
    return common::Status::error(stored_embedder.kind(), stored_embedder.error());
  }

  const bool unbound = stored_dimensions.value().empty();
  const bool same_layout = stored_dimensions.value() == dimensions &&
                           stored_element_size.value() == element_size;

  if (!unbound && !same_layout) {
    auto records = count_locked();
    if (!records.ok()) {
      return common::Status::error(records.kind(), records.error());
    }
    if (records.value() > 0) {
      return common::Status::error(
          common::ErrorKind::Configuration,
          "collection holds " + std::to_string(records.value()) + " vectors of " +
              stored_dimensions.value() + " dimensions (" + stored_element_size.value() +
              " bytes each), configured embedder produces " + dimensions + " (" + element_size +
              " bytes each)");
    }
  }

  if (!unbound && same_layout) {
    if (stored_embedder.value() != layout.embedder) {
      observability::record_error("storage", "collection was built with embedder '" +
                                                 stored_embedder.value() + "', now using '" +
                                                 layout.embedder + "'");
    }
    return common::Status::success();
  }

  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }
  for (const auto &[key, value] :
       {std::pair<std::string, std::string>{"vector_dimensions", dimensions},
        std::pair<std::string, std::string>{"vector_element_size", element_size},
        std::pair<std::string, std::string>{"embedder", layout.embedder}}) {
    status = set_meta_value(key, value);
    if (!status.ok()) {
      (void)exec_sql(db_, "ROLLBACK;");
      return status;
    }
  }
  return exec_sql(db_, "COMMIT;");
}

common::Result<StoredItem> SqliteRecordStore::create_record(const NewRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO images(filename, original_filename, caption, embedding, file_path, file_size,
                   content_type, upload_time)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<StoredItem>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }

  const std::string created_at = now_rfc3339();
  sqlite3_bind_text(stmt, 1, record.filename.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, record.original_filename.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, record.caption.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 4, record.vector_blob.data(), static_cast<int>(record.vector_blob.size()),
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, record.file_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(record.size_bytes));
  sqlite3_bind_text(stmt, 7, record.content_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, created_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<StoredItem>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }

  StoredItem item;
  item.id = sqlite3_last_insert_rowid(db_);
  item.filename = record.filename;
  item.original_filename = record.original_filename;
  item.caption = record.caption;
  item.vector_blob = record.vector_blob;
  item.file_path = record.file_path;
  item.size_bytes = record.size_bytes;
  item.content_type = record.content_type;
  item.created_at = created_at;
  return common::Result<StoredItem>::success(std::move(item));
}

common::Result<std::vector<StoredItem>>
SqliteRecordStore::query_items(const std::string &sql, const std::int64_t arg1,
                               const std::int64_t arg2) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<StoredItem>>::failure(common::ErrorKind::Storage,
                                                            sqlite3_errmsg(db_));
  }
  const int params = sqlite3_bind_parameter_count(stmt);
  if (params >= 1) {
    sqlite3_bind_int64(stmt, 1, arg1);
  }
  if (params >= 2) {
    sqlite3_bind_int64(stmt, 2, arg2);
  }

  std::vector<StoredItem> items;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    items.push_back(row_to_item(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<StoredItem>>::failure(common::ErrorKind::Storage,
                                                            sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<StoredItem>>::success(std::move(items));
}

common::Result<std::vector<StoredItem>> SqliteRecordStore::list_all_records() {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_items(std::string("SELECT ") + kItemColumns + " FROM images ORDER BY id ASC", 0, 0);
}

common::Result<std::vector<StoredItem>> SqliteRecordStore::list_records(const std::size_t offset,
                                                                        const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_items(std::string("SELECT ") + kItemColumns +
                         " FROM images ORDER BY upload_time DESC, id DESC LIMIT ?1 OFFSET ?2",
                     static_cast<std::int64_t>(limit), static_cast<std::int64_t>(offset));
}

common::Result<std::optional<StoredItem>> SqliteRecordStore::get_record(const std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto items =
      query_items(std::string("SELECT ") + kItemColumns + " FROM images WHERE id = ?1", id, 0);
  if (!items.ok()) {
    return common::Result<std::optional<StoredItem>>::failure(items.kind(), items.error());
  }
  if (items.value().empty()) {
    return common::Result<std::optional<StoredItem>>::success(std::nullopt);
  }
  return common::Result<std::optional<StoredItem>>::success(std::move(items.value().front()));
}

common::Result<bool> SqliteRecordStore::delete_record(const std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM images WHERE id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<bool>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::size_t> SqliteRecordStore::count_locked() {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM images", -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return common::Result<std::size_t>::success(total);
}

common::Result<std::size_t> SqliteRecordStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_locked();
}

bool SqliteRecordStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return exec_sql(db_, "SELECT 1;").ok();
}

} // namespace snapseek::storage
