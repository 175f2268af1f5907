#pragma once

#include "fitscore/vector/embedding_cache.h"

#include <map>
#include <mutex>

namespace fitscore::vector {

// InMemoryEmbeddingCache keeps vectors in a std::map guarded by a mutex.
// Lives for the process; suitable for tests and single-run batch ranking.
class InMemoryEmbeddingCache final : public IEmbeddingCache {
 public:
  void put(const CacheKey& key, const Vector& embedding) override;
  [[nodiscard]] std::optional<Vector> get(const CacheKey& key) const override;
  [[nodiscard]] std::size_t size() const override;

 private:
  mutable std::mutex mutex_;
  std::map<CacheKey, Vector> vectors_;
};

}  // namespace fitscore::vector
