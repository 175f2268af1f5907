#include "fitscore/vector/inmemory_embedding_cache.h"

namespace fitscore::vector {

void InMemoryEmbeddingCache::put(const CacheKey& key, const Vector& embedding) {
  const std::lock_guard<std::mutex> lock(mutex_);
  vectors_[key] = embedding;
}

std::optional<Vector> InMemoryEmbeddingCache::get(const CacheKey& key) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  auto it = vectors_.find(key);
  if (it != vectors_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::size_t InMemoryEmbeddingCache::size() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return vectors_.size();
}

}  // namespace fitscore::vector
