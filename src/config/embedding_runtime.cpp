#include "fitscore/config/embedding_runtime.h"

#include "fitscore/embedding/caching_embedding_provider.h"
#include "fitscore/vector/sqlite_embedding_cache.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace fitscore::config {

namespace {

std::unique_ptr<embedding::IEmbeddingProvider> make_base_provider(const EmbeddingConfig& config) {
  switch (config.backend) {
    case EmbeddingBackend::kNone:
      return std::make_unique<embedding::NullEmbeddingProvider>();
    case EmbeddingBackend::kUnavailable: {
      const std::string model = config.model_id.empty() ? "sentence-encoder" : config.model_id;
      return std::make_unique<embedding::SentenceEncoderEmbeddingProvider>(
          [model]() -> std::unique_ptr<embedding::ISentenceEncoder> {
            throw std::runtime_error("no encoder runtime available for model '" + model + "'");
          },
          config.dimension);
    }
    case EmbeddingBackend::kStub:
      break;
  }
  return std::make_unique<embedding::DeterministicStubEmbeddingProvider>(config.dimension);
}

}  // namespace

EmbeddingRuntime::EmbeddingRuntime(const EmbeddingConfig& config)
    : base_(make_base_provider(config)) {
  if (config.cache_path.has_value()) {
    cache_ = std::make_unique<vector::SqliteEmbeddingCache>(*config.cache_path);
    cached_ = std::make_unique<embedding::CachingEmbeddingProvider>(*base_, *cache_);
    spdlog::info("Embedding cache enabled at {}", *config.cache_path);
  }
  spdlog::debug("Embedding provider: backend={} model={} dimension={}",
                backend_name(config.backend), base_->model_id(), base_->dimension());
}

EmbeddingRuntime::~EmbeddingRuntime() = default;

const embedding::IEmbeddingProvider& EmbeddingRuntime::provider() const {
  return cached_ != nullptr ? *cached_ : *base_;
}

}  // namespace fitscore::config
