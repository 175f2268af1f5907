#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/embedding/placeholder.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace fitscore::embedding {

SentenceEncoderEmbeddingProvider::SentenceEncoderEmbeddingProvider(
    const EncoderLoader& loader, const std::size_t expected_dimension)
    : dimension_(expected_dimension) {
  try {
    if (loader) {
      encoder_ = loader();
    }
  } catch (const std::exception& e) {
    spdlog::warn("Sentence encoder failed to load ({}); embeddings degrade to placeholders",
                 e.what());
    encoder_.reset();
    return;
  }

  if (encoder_ == nullptr) {
    spdlog::warn("Sentence encoder unavailable; embeddings degrade to placeholders");
  }
}

std::string SentenceEncoderEmbeddingProvider::model_id() const {
  if (encoder_ == nullptr) {
    return "placeholder";
  }
  return encoder_->name();
}

vector::Vector SentenceEncoderEmbeddingProvider::embed_text(std::string_view text) const {
  if (encoder_ == nullptr) {
    return make_placeholder_embedding(dimension_);
  }

  vector::Vector embedding;
  try {
    embedding = encoder_->encode(text);
  } catch (const std::exception& e) {
    spdlog::warn("Sentence encoder '{}' failed on input of {} bytes ({}); using placeholder",
                 encoder_->name(), text.size(), e.what());
    return make_placeholder_embedding(dimension_);
  }

  if (embedding.size() != dimension_) {
    spdlog::warn("Sentence encoder '{}' returned {} dimensions, expected {}; using placeholder",
                 encoder_->name(), embedding.size(), dimension_);
    return make_placeholder_embedding(dimension_);
  }

  return embedding;
}

}  // namespace fitscore::embedding
