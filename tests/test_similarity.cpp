#include "fitscore/embedding/placeholder.h"
#include "fitscore/matching/similarity.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <limits>

using namespace fitscore;
using Catch::Matchers::WithinAbs;

TEST_CASE("Similarity of comparable vectors", "[matching][similarity]") {
  const vector::Vector x = {1.0f, 0.0f, 0.0f};
  const vector::Vector y = {0.0f, 1.0f, 0.0f};
  const vector::Vector neg_x = {-1.0f, 0.0f, 0.0f};
  const vector::Vector diag = {1.0f, 1.0f, 0.0f};

  SECTION("identical direction") {
    const auto result = matching::similarity(x, x);
    CHECK_THAT(result.value, WithinAbs(1.0, 1e-9));
    CHECK_FALSE(result.fallback);
  }

  SECTION("orthogonal") {
    const auto result = matching::similarity(x, y);
    CHECK_THAT(result.value, WithinAbs(0.0, 1e-9));
    CHECK_FALSE(result.fallback);
  }

  SECTION("opposite directions clamp to zero") {
    CHECK_THAT(matching::cosine_similarity(x, neg_x), WithinAbs(-1.0, 1e-9));
    CHECK_THAT(matching::similarity(x, neg_x).value, WithinAbs(0.0, 1e-9));
  }

  SECTION("45 degrees") {
    CHECK_THAT(matching::similarity(x, diag).value, WithinAbs(0.70710678, 1e-6));
  }
}

TEST_CASE("Similarity falls back when vectors cannot be compared", "[matching][similarity]") {
  const vector::Vector real = {0.3f, -0.2f, 0.9f};

  SECTION("absent vector") {
    const auto result = matching::similarity({}, real);
    CHECK(result.value == matching::kFallbackSimilarity);
    CHECK(result.value == 0.75);
    CHECK(result.fallback);
  }

  SECTION("dimension mismatch") {
    const auto result = matching::similarity(real, vector::Vector{0.3f, -0.2f});
    CHECK(result.value == 0.75);
    CHECK(result.fallback);
  }

  SECTION("placeholder vector is treated as absent") {
    const auto placeholder = embedding::make_placeholder_embedding(3);
    const auto result = matching::similarity(placeholder, placeholder);
    CHECK(result.value == 0.75);
    CHECK(result.fallback);
  }

  SECTION("non-finite component") {
    const vector::Vector broken = {std::numeric_limits<float>::quiet_NaN(), 0.1f, 0.2f};
    const auto result = matching::similarity(broken, real);
    CHECK(result.value == 0.75);
    CHECK(result.fallback);
  }

  SECTION("zero vector") {
    const auto result = matching::similarity(vector::Vector{0.0f, 0.0f, 0.0f}, real);
    CHECK(result.value == 0.75);
    CHECK(result.fallback);
  }
}
