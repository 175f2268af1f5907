#pragma once

#include "fitscore/core/result.h"
#include "fitscore/matching/scorer.h"

#include <cstddef>
#include <optional>
#include <string>

namespace fitscore::config {

// EmbeddingBackend selects the embedding provider built at startup.
// kStub:        deterministic hash encoder (offline, no model)
// kNone:        embeddings disabled; similarity always falls back
// kUnavailable: an encoder that fails to load; forces degraded placeholder mode
enum class EmbeddingBackend {
  kStub,
  kNone,
  kUnavailable,
};

[[nodiscard]] std::string backend_name(EmbeddingBackend backend);
[[nodiscard]] std::optional<EmbeddingBackend> parse_backend(const std::string& name);

struct EmbeddingConfig {
  EmbeddingBackend backend{EmbeddingBackend::kStub};
  std::size_t dimension{768};
  std::string model_id;                   // Encoder to load; empty selects the backend default
  std::optional<std::string> cache_path;  // SQLite embedding cache; absent = no cache
};

struct BatchConfig {
  std::size_t max_parallelism{1};
  std::size_t top_k{0};
};

// EngineConfig holds every externally supplied setting of the engine.
// Every field has a default, so "{}" is a valid configuration.
struct EngineConfig {
  matching::ScoreWeights weights;
  EmbeddingConfig embedding;
  BatchConfig batch;
  std::string log_level{"info"};
};

// validate_weights rejects negative or non-finite weights.
[[nodiscard]] core::Result<bool, std::string> validate_weights(const matching::ScoreWeights& w);

// parse_engine_config reads a JSON document. Missing keys keep their defaults; a partial
// "weights" object overrides only the keys it names.
// Errors: malformed JSON, wrong value types, unknown backend, invalid weights,
// zero dimension.
[[nodiscard]] core::Result<EngineConfig, std::string> parse_engine_config(
    const std::string& json_str);

// load_engine_config reads and parses a file.
[[nodiscard]] core::Result<EngineConfig, std::string> load_engine_config(const std::string& path);

// to_json serializes the effective configuration. Keys are sorted alphabetically.
[[nodiscard]] std::string to_json(const EngineConfig& config);

}  // namespace fitscore::config
