#pragma once

#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/vector/embedding_cache.h"

#include <string>
#include <string_view>

namespace fitscore::embedding {

// CachingEmbeddingProvider decorates a provider with an IEmbeddingCache.
// Cache key: inner.model_id() + ":" + stable_hash64_hex(text), so switching models
// never serves stale vectors.
// Empty and placeholder vectors are returned but never stored, so a recovered
// encoder is not shadowed by degraded-mode output.
// Holds references (not ownership); both must outlive this object.
class CachingEmbeddingProvider final : public IEmbeddingProvider {
 public:
  CachingEmbeddingProvider(const IEmbeddingProvider& inner, vector::IEmbeddingCache& cache);

  [[nodiscard]] vector::Vector embed_text(std::string_view text) const override;
  [[nodiscard]] std::size_t dimension() const override { return inner_.dimension(); }
  [[nodiscard]] std::string model_id() const override { return inner_.model_id(); }

  [[nodiscard]] std::string cache_key(std::string_view text) const;

 private:
  const IEmbeddingProvider& inner_;
  vector::IEmbeddingCache& cache_;
};

}  // namespace fitscore::embedding
