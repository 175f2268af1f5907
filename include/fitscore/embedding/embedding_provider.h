#pragma once

#include "fitscore/vector/embedding_cache.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace fitscore::embedding {

// IEmbeddingProvider converts text to a fixed-dimension vector.
// Implementations are used concurrently by batch matching: embed_text must be safe
// to call from several threads at once.
class IEmbeddingProvider {
 public:
  virtual ~IEmbeddingProvider() = default;

  // embed_text converts text to a vector of dimension() floats.
  // Determinism: for the same text, must return the same vector.
  // An empty result means "no embedding available" (similarity falls back).
  [[nodiscard]] virtual vector::Vector embed_text(std::string_view text) const = 0;

  // dimension returns the embedding vector dimension (0 when embeddings are disabled).
  [[nodiscard]] virtual std::size_t dimension() const = 0;

  // model_id identifies the model for cache keys and diagnostics.
  [[nodiscard]] virtual std::string model_id() const = 0;
};

// NullEmbeddingProvider returns empty vectors (disables embedding similarity).
class NullEmbeddingProvider final : public IEmbeddingProvider {
 public:
  [[nodiscard]] vector::Vector embed_text(std::string_view text) const override;
  [[nodiscard]] std::size_t dimension() const override { return 0; }
  [[nodiscard]] std::string model_id() const override { return "none"; }
};

// DeterministicStubEmbeddingProvider generates stable vectors without a model.
// Words and adjacent-word pairs of the diacritic-folded text are feature-hashed into
// dimension buckets with a hashed sign, weighted 1 + ln(count), then L2-normalized.
// Texts sharing vocabulary get positive cosine similarity. Empty text yields the zero vector.
class DeterministicStubEmbeddingProvider final : public IEmbeddingProvider {
 public:
  explicit DeterministicStubEmbeddingProvider(std::size_t dim = 128);

  [[nodiscard]] vector::Vector embed_text(std::string_view text) const override;
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }
  [[nodiscard]] std::string model_id() const override;

 private:
  std::size_t dimension_;
};

// ISentenceEncoder is the boundary to a pretrained sentence encoder. The model itself is
// an external black box: fitscore only calls encode() and never re-implements it.
// encode() may throw; the model weights must be immutable after load so concurrent
// encode() calls are safe.
class ISentenceEncoder {
 public:
  virtual ~ISentenceEncoder() = default;

  [[nodiscard]] virtual vector::Vector encode(std::string_view text) const = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

// EncoderLoader loads the encoder once. It may throw or return nullptr on failure.
using EncoderLoader = std::function<std::unique_ptr<ISentenceEncoder>()>;

// SentenceEncoderEmbeddingProvider wraps an external encoder and keeps the pipeline total:
// - loader failure (exception or nullptr) puts the provider in degraded mode for its
//   lifetime; every call then returns the placeholder vector.
// - an encode() exception, or a result whose size differs from expected_dimension,
//   returns the placeholder vector for that call.
// Each degradation is logged as a warning. embed_text never throws.
class SentenceEncoderEmbeddingProvider final : public IEmbeddingProvider {
 public:
  SentenceEncoderEmbeddingProvider(const EncoderLoader& loader, std::size_t expected_dimension);

  [[nodiscard]] vector::Vector embed_text(std::string_view text) const override;
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }
  [[nodiscard]] std::string model_id() const override;

  // degraded reports whether the encoder failed to load.
  [[nodiscard]] bool degraded() const { return encoder_ == nullptr; }

 private:
  std::unique_ptr<ISentenceEncoder> encoder_;
  std::size_t dimension_;
};

}  // namespace fitscore::embedding
