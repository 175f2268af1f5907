#include "fitscore/diagnostics/embedding_diagnostics.h"

#include "fitscore/embedding/placeholder.h"
#include "fitscore/matching/similarity.h"

#include <algorithm>
#include <cmath>

namespace fitscore::diagnostics {

namespace {

constexpr std::string_view kSampleAnchor =
    "Senior Python developer building REST APIs with Django and PostgreSQL";
constexpr std::string_view kSampleRelated =
    "Backend engineer writing Python web services on Django with a PostgreSQL database";
constexpr std::string_view kSampleUnrelated =
    "Pastry chef preparing croissants and seasonal fruit tarts for a bakery";

}  // namespace

std::string_view status_name(const EmbeddingStatus status) {
  switch (status) {
    case EmbeddingStatus::kAbsent:
      return "absent";
    case EmbeddingStatus::kPlaceholder:
      return "placeholder";
    case EmbeddingStatus::kNonFinite:
      return "non_finite";
    case EmbeddingStatus::kZeroNorm:
      return "zero_norm";
    case EmbeddingStatus::kValid:
      return "valid";
  }
  return "unknown";
}

EmbeddingInspection inspect_embedding(const vector::Vector& embedding,
                                      const std::size_t expected_dimension) {
  EmbeddingInspection inspection;
  inspection.dimension = embedding.size();
  inspection.dimension_matches = embedding.size() == expected_dimension;

  const auto preview_size = std::min(kPreviewComponents, embedding.size());
  inspection.preview.assign(embedding.begin(),
                            embedding.begin() + static_cast<std::ptrdiff_t>(preview_size));

  if (embedding.empty()) {
    inspection.status = EmbeddingStatus::kAbsent;
    return inspection;
  }

  const bool finite = std::all_of(embedding.begin(), embedding.end(),
                                  [](const float x) { return std::isfinite(x); });
  if (!finite) {
    inspection.status = EmbeddingStatus::kNonFinite;
    return inspection;
  }

  double sum = 0.0;
  for (const float x : embedding) {
    sum += static_cast<double>(x) * static_cast<double>(x);
  }
  inspection.norm = std::sqrt(sum);

  if (inspection.norm == 0.0) {
    inspection.status = EmbeddingStatus::kZeroNorm;
  } else if (embedding::is_placeholder_embedding(embedding)) {
    inspection.status = EmbeddingStatus::kPlaceholder;
  } else {
    inspection.status = EmbeddingStatus::kValid;
  }
  return inspection;
}

ProviderCheck check_provider(const embedding::IEmbeddingProvider& provider) {
  ProviderCheck check;
  check.model_id = provider.model_id();
  check.dimension = provider.dimension();

  const auto anchor = provider.embed_text(kSampleAnchor);
  const auto related = provider.embed_text(kSampleRelated);
  const auto unrelated = provider.embed_text(kSampleUnrelated);

  for (const auto* v : {&anchor, &related, &unrelated}) {
    check.emits_empty = check.emits_empty || v->empty();
    check.emits_placeholders = check.emits_placeholders || embedding::is_placeholder_embedding(*v);
  }

  check.related_similarity = matching::similarity(anchor, related).value;
  check.unrelated_similarity = matching::similarity(anchor, unrelated).value;
  check.ranks_related_higher = !check.emits_empty && !check.emits_placeholders &&
                               check.related_similarity > check.unrelated_similarity;
  return check;
}

}  // namespace fitscore::diagnostics
