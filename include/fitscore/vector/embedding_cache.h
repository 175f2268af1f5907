#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fitscore::vector {

using Vector = std::vector<float>;
using CacheKey = std::string;  // model_id + ":" + stable_hash64_hex(text)

// IEmbeddingCache stores derived embeddings so repeated texts skip model inference.
// The cache is rebuildable: losing it only costs recomputation.
// Implementations must be safe for concurrent get/put (batch matching fans out).
class IEmbeddingCache {
 public:
  virtual ~IEmbeddingCache() = default;

  // put inserts or replaces the vector stored under key.
  virtual void put(const CacheKey& key, const Vector& embedding) = 0;

  // get returns the stored vector, or nullopt when the key is unknown.
  [[nodiscard]] virtual std::optional<Vector> get(const CacheKey& key) const = 0;

  [[nodiscard]] virtual std::size_t size() const = 0;
};

}  // namespace fitscore::vector
