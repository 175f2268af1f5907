#pragma once

#include "fitscore/config/engine_config.h"
#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/vector/embedding_cache.h"

#include <memory>

namespace fitscore::config {

// EmbeddingRuntime owns the provider stack selected by an EmbeddingConfig:
// base provider, optional cache, and the caching decorator over both.
// provider() is the entry point the Matcher borrows.
class EmbeddingRuntime {
 public:
  // Throws std::runtime_error if the configured cache database cannot be opened.
  explicit EmbeddingRuntime(const EmbeddingConfig& config);
  ~EmbeddingRuntime();

  EmbeddingRuntime(const EmbeddingRuntime&) = delete;
  EmbeddingRuntime& operator=(const EmbeddingRuntime&) = delete;

  [[nodiscard]] const embedding::IEmbeddingProvider& provider() const;

  // cache returns nullptr when no cache_path was configured.
  [[nodiscard]] const vector::IEmbeddingCache* cache() const { return cache_.get(); }

 private:
  std::unique_ptr<embedding::IEmbeddingProvider> base_;
  std::unique_ptr<vector::IEmbeddingCache> cache_;
  std::unique_ptr<embedding::IEmbeddingProvider> cached_;
};

}  // namespace fitscore::config
