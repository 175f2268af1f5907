#include "fitscore/core/hashing.h"
#include "fitscore/core/normalization.h"
#include "fitscore/embedding/embedding_provider.h"

#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace fitscore::embedding {

namespace {

// Independent seed for the sign hash.
constexpr std::uint64_t kSignSeed = 0x9e3779b97f4a7c15ull;

// Adjacent-word features ("machine learning") count for less than single words.
constexpr float kBigramWeight = 0.5f;

// Signed feature hashing: the bucket comes from one hash, the sign from another.
void add_feature(vector::Vector& embedding, const std::string& feature, const float weight) {
  const std::size_t idx = core::stable_hash64(feature) % embedding.size();
  const bool negative = (core::stable_hash64(feature, kSignSeed) & 1u) != 0;
  embedding[idx] += negative ? -weight : weight;
}

// Sublinear term frequency.
float term_weight(const int count) {
  return 1.0f + std::log(static_cast<float>(count));
}

}  // namespace

vector::Vector NullEmbeddingProvider::embed_text(std::string_view /* text */) const {
  return {};
}

DeterministicStubEmbeddingProvider::DeterministicStubEmbeddingProvider(std::size_t dim)
    : dimension_(dim) {}

std::string DeterministicStubEmbeddingProvider::model_id() const {
  return "deterministic-stub-" + std::to_string(dimension_);
}

vector::Vector DeterministicStubEmbeddingProvider::embed_text(std::string_view text) const {
  if (dimension_ == 0) {
    return {};
  }

  vector::Vector embedding(dimension_, 0.0f);

  const std::vector<std::string> tokens = core::tokenize_ascii(core::fold_diacritics(text));
  if (tokens.empty()) {
    return embedding;
  }

  std::map<std::string, int> unigrams;
  std::map<std::string, int> bigrams;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    ++unigrams[tokens[i]];
    if (i + 1 < tokens.size()) {
      ++bigrams[tokens[i] + " " + tokens[i + 1]];
    }
  }

  for (const auto& [token, count] : unigrams) {
    add_feature(embedding, token, term_weight(count));
  }
  for (const auto& [pair, count] : bigrams) {
    add_feature(embedding, pair, kBigramWeight * term_weight(count));
  }

  double norm = 0.0;
  for (const float value : embedding) {
    norm += static_cast<double>(value) * static_cast<double>(value);
  }
  if (norm > 0.0) {
    const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& value : embedding) {
      value *= inv;
    }
  }

  return embedding;
}

}  // namespace fitscore::embedding
