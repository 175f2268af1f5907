#include "fitscore/embedding/placeholder.h"

#include <cmath>

namespace fitscore::embedding {

vector::Vector make_placeholder_embedding(const std::size_t dimension) {
  return vector::Vector(dimension, kPlaceholderComponent);
}

bool is_placeholder_embedding(const vector::Vector& embedding) {
  if (embedding.size() < 2) {
    return false;
  }

  const float first = embedding.front();
  if (!std::isfinite(first) || std::fabs(first) > kPlaceholderMaxMagnitude) {
    return false;
  }

  for (const float value : embedding) {
    if (value != first) {
      return false;
    }
  }
  return true;
}

}  // namespace fitscore::embedding
