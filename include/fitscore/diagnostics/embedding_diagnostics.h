#pragma once

#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/vector/embedding_cache.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fitscore::diagnostics {

enum class EmbeddingStatus {
  kAbsent,       // Empty vector
  kPlaceholder,  // Constant low-magnitude vector (mock or degraded encoder)
  kNonFinite,    // Contains NaN or infinity
  kZeroNorm,     // All zeros
  kValid,
};

[[nodiscard]] std::string_view status_name(EmbeddingStatus status);

struct EmbeddingInspection {
  EmbeddingStatus status{EmbeddingStatus::kAbsent};
  std::size_t dimension{0};
  bool dimension_matches{false};  // dimension == expected_dimension
  double norm{0.0};
  std::vector<float> preview;     // First kPreviewComponents values
};

constexpr std::size_t kPreviewComponents = 5;

// inspect_embedding classifies a stored or freshly computed vector.
// Placeholders are reported distinctly from genuine embeddings.
[[nodiscard]] EmbeddingInspection inspect_embedding(const vector::Vector& embedding,
                                                    std::size_t expected_dimension);

struct ProviderCheck {
  std::string model_id;
  std::size_t dimension{0};
  bool emits_placeholders{false};
  bool emits_empty{false};
  double related_similarity{0.0};    // Two texts about the same role
  double unrelated_similarity{0.0};  // A text about an unrelated topic
  bool ranks_related_higher{false};
};

// check_provider embeds three sample texts and reports whether the provider produces
// usable vectors that rank a related pair above an unrelated one.
[[nodiscard]] ProviderCheck check_provider(const embedding::IEmbeddingProvider& provider);

}  // namespace fitscore::diagnostics
