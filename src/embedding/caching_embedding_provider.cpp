#include "fitscore/embedding/caching_embedding_provider.h"

#include "fitscore/core/hashing.h"
#include "fitscore/embedding/placeholder.h"

namespace fitscore::embedding {

CachingEmbeddingProvider::CachingEmbeddingProvider(const IEmbeddingProvider& inner,
                                                   vector::IEmbeddingCache& cache)
    : inner_(inner), cache_(cache) {}

std::string CachingEmbeddingProvider::cache_key(std::string_view text) const {
  return inner_.model_id() + ":" + core::stable_hash64_hex(text);
}

vector::Vector CachingEmbeddingProvider::embed_text(std::string_view text) const {
  const std::string key = cache_key(text);

  if (auto cached = cache_.get(key); cached.has_value()) {
    return std::move(cached.value());
  }

  vector::Vector embedding = inner_.embed_text(text);
  if (!embedding.empty() && !is_placeholder_embedding(embedding)) {
    cache_.put(key, embedding);
  }
  return embedding;
}

}  // namespace fitscore::embedding
