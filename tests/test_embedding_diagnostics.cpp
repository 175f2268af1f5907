#include "fitscore/diagnostics/embedding_diagnostics.h"
#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/embedding/placeholder.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <limits>
#include <memory>
#include <stdexcept>

using namespace fitscore;
using Catch::Matchers::WithinAbs;

TEST_CASE("inspect_embedding classifies vectors", "[diagnostics]") {
  SECTION("absent") {
    const auto inspection = diagnostics::inspect_embedding({}, 768);
    CHECK(inspection.status == diagnostics::EmbeddingStatus::kAbsent);
    CHECK(inspection.dimension == 0);
    CHECK_FALSE(inspection.dimension_matches);
  }

  SECTION("placeholder is distinct from a real embedding") {
    const auto inspection =
        diagnostics::inspect_embedding(embedding::make_placeholder_embedding(768), 768);
    CHECK(inspection.status == diagnostics::EmbeddingStatus::kPlaceholder);
    CHECK(inspection.dimension_matches);
    CHECK(inspection.preview.size() == diagnostics::kPreviewComponents);
    CHECK(diagnostics::status_name(inspection.status) == "placeholder");
  }

  SECTION("non-finite") {
    const vector::Vector v = {0.2f, std::numeric_limits<float>::infinity(), 0.1f};
    CHECK(diagnostics::inspect_embedding(v, 3).status ==
          diagnostics::EmbeddingStatus::kNonFinite);
  }

  SECTION("zero norm") {
    CHECK(diagnostics::inspect_embedding(vector::Vector(4, 0.0f), 4).status ==
          diagnostics::EmbeddingStatus::kZeroNorm);
  }

  SECTION("valid") {
    const vector::Vector v = {0.6f, 0.0f, -0.8f};
    const auto inspection = diagnostics::inspect_embedding(v, 768);
    CHECK(inspection.status == diagnostics::EmbeddingStatus::kValid);
    CHECK_FALSE(inspection.dimension_matches);
    CHECK_THAT(inspection.norm, WithinAbs(1.0, 1e-6));
    CHECK(inspection.preview == v);
  }
}

TEST_CASE("check_provider on a working encoder", "[diagnostics]") {
  const embedding::DeterministicStubEmbeddingProvider provider(768);
  const auto check = diagnostics::check_provider(provider);

  CHECK(check.model_id == "deterministic-stub-768");
  CHECK(check.dimension == 768);
  CHECK_FALSE(check.emits_placeholders);
  CHECK_FALSE(check.emits_empty);
  CHECK(check.related_similarity > check.unrelated_similarity);
  CHECK(check.ranks_related_higher);
}

TEST_CASE("check_provider flags degraded providers", "[diagnostics]") {
  SECTION("placeholder output") {
    const embedding::SentenceEncoderEmbeddingProvider provider(
        []() -> std::unique_ptr<embedding::ISentenceEncoder> {
          throw std::runtime_error("model missing");
        },
        768);
    const auto check = diagnostics::check_provider(provider);
    CHECK(check.emits_placeholders);
    CHECK_FALSE(check.ranks_related_higher);
    CHECK(check.related_similarity == 0.75);
  }

  SECTION("empty output") {
    const embedding::NullEmbeddingProvider provider;
    const auto check = diagnostics::check_provider(provider);
    CHECK(check.emits_empty);
    CHECK_FALSE(check.ranks_related_higher);
  }
}
