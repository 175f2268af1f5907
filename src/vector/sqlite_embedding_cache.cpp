#include "fitscore/vector/sqlite_embedding_cache.h"

#include <spdlog/spdlog.h>

#include <cstring>
#include <sqlite3.h>
#include <stdexcept>

namespace fitscore::vector {

namespace {

constexpr int kBusyTimeoutMs = 2000;

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  cache_key    TEXT PRIMARY KEY,
  vector_blob  BLOB NOT NULL,
  dimension    INTEGER NOT NULL,
  created_at   TEXT NOT NULL DEFAULT (datetime('now'))
);
)";

// Owns one prepared statement for the duration of a call.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      error_ = sqlite3_errmsg(db);
      stmt_ = nullptr;
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3_stmt* stmt_ = nullptr;
  std::string error_;
};

}  // namespace

void SqliteEmbeddingCache::DbDeleter::operator()(sqlite3* db) const {
  sqlite3_close_v2(db);
}

SqliteEmbeddingCache::SqliteEmbeddingCache(const std::string& db_path) {
  sqlite3* raw_db = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  const int rc = sqlite3_open_v2(db_path.c_str(), &raw_db, flags, nullptr);
  db_.reset(raw_db);
  if (rc != SQLITE_OK) {
    const std::string err = raw_db != nullptr ? sqlite3_errmsg(raw_db) : sqlite3_errstr(rc);
    throw std::runtime_error("SqliteEmbeddingCache: cannot open '" + db_path + "': " + err);
  }
  sqlite3_busy_timeout(db_.get(), kBusyTimeoutMs);
  ensure_schema();
}

SqliteEmbeddingCache::~SqliteEmbeddingCache() = default;

void SqliteEmbeddingCache::ensure_schema() {
  char* err_msg = nullptr;
  if (sqlite3_exec(db_.get(), kSchema, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    const std::string err = err_msg != nullptr ? err_msg : "unknown error";
    sqlite3_free(err_msg);
    throw std::runtime_error("SqliteEmbeddingCache: schema setup failed: " + err);
  }
}

void SqliteEmbeddingCache::put(const CacheKey& key, const Vector& embedding) {
  const std::lock_guard<std::mutex> lock(mutex_);

  const Statement stmt(db_.get(),
                       "INSERT OR REPLACE INTO embedding_cache (cache_key, vector_blob, dimension) "
                       "VALUES (?1, ?2, ?3)");
  if (!stmt.ok()) {
    spdlog::warn("embedding cache: cannot prepare write: {}", stmt.error());
    return;
  }

  const auto bytes = to_blob(embedding);
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  // A zero-length blob would bind as NULL and violate NOT NULL.
  if (bytes.empty()) {
    sqlite3_bind_zeroblob(stmt.get(), 2, 0);
  } else {
    sqlite3_bind_blob(stmt.get(), 2, bytes.data(), static_cast<int>(bytes.size()),
                      SQLITE_TRANSIENT);
  }
  sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(embedding.size()));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    spdlog::warn("embedding cache: write failed for key {}: {}", key, sqlite3_errmsg(db_.get()));
  }
}

std::optional<Vector> SqliteEmbeddingCache::get(const CacheKey& key) const {
  const std::lock_guard<std::mutex> lock(mutex_);

  const Statement stmt(db_.get(),
                       "SELECT vector_blob, dimension FROM embedding_cache WHERE cache_key = ?1");
  if (!stmt.ok()) {
    spdlog::warn("embedding cache: cannot prepare read: {}", stmt.error());
    return std::nullopt;
  }
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  const void* data = sqlite3_column_blob(stmt.get(), 0);
  const int size_bytes = sqlite3_column_bytes(stmt.get(), 0);
  const auto dimension = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 1));

  // Blob size must agree with the stored dimension; anything else reads as a miss.
  if (static_cast<std::size_t>(size_bytes) != dimension * sizeof(float)) {
    spdlog::warn("embedding cache: entry {} has {} bytes for dimension {}; ignoring", key,
                 size_bytes, dimension);
    return std::nullopt;
  }
  return from_blob(data, size_bytes);
}

std::size_t SqliteEmbeddingCache::size() const {
  const std::lock_guard<std::mutex> lock(mutex_);

  const Statement stmt(db_.get(), "SELECT COUNT(*) FROM embedding_cache");
  if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<std::byte> SqliteEmbeddingCache::to_blob(const Vector& v) {
  std::vector<std::byte> blob(v.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), v.data(), blob.size());
  }
  return blob;
}

Vector SqliteEmbeddingCache::from_blob(const void* data, const int size_bytes) {
  if (data == nullptr || size_bytes <= 0) {
    return {};
  }
  Vector result(static_cast<std::size_t>(size_bytes) / sizeof(float));
  std::memcpy(result.data(), data, result.size() * sizeof(float));
  return result;
}

}  // namespace fitscore::vector
