#pragma once

#include "fitscore/vector/embedding_cache.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare sqlite3 to avoid exposing the SQLite header in the public API.
struct sqlite3;

namespace fitscore::vector {

// SqliteEmbeddingCache persists embeddings across runs in a dedicated SQLite database.
//
// Schema: embedding_cache(cache_key TEXT PK, vector_blob BLOB, dimension INT,
//                         created_at TEXT)
// vector_blob holds dimension raw float32 values in native byte order. A row whose blob
// size disagrees with its dimension is logged and read as a miss.
//
// One connection per instance, serialized by an internal mutex.
class SqliteEmbeddingCache final : public IEmbeddingCache {
 public:
  // Opens or creates the database at db_path (":memory:" for a private in-memory DB).
  // Throws std::runtime_error if the database cannot be opened or the schema fails.
  explicit SqliteEmbeddingCache(const std::string& db_path);

  // Defined in the .cpp so the sqlite3 deleter runs where sqlite3 is a complete type.
  ~SqliteEmbeddingCache() override;

  SqliteEmbeddingCache(const SqliteEmbeddingCache&) = delete;
  SqliteEmbeddingCache& operator=(const SqliteEmbeddingCache&) = delete;
  SqliteEmbeddingCache(SqliteEmbeddingCache&&) = delete;
  SqliteEmbeddingCache& operator=(SqliteEmbeddingCache&&) = delete;

  // Inserts or replaces. A failed write is logged as a warning and otherwise ignored.
  void put(const CacheKey& key, const Vector& embedding) override;

  [[nodiscard]] std::optional<Vector> get(const CacheKey& key) const override;

  [[nodiscard]] std::size_t size() const override;

 private:
  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  mutable std::mutex mutex_;
  std::unique_ptr<sqlite3, DbDeleter> db_;

  void ensure_schema();

  [[nodiscard]] static std::vector<std::byte> to_blob(const Vector& v);
  [[nodiscard]] static Vector from_blob(const void* data, int size_bytes);
};

}  // namespace fitscore::vector
