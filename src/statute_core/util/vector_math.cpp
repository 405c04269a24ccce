#include "statute_core/util/vector_math.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace statute_core {

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("cosine_similarity: size mismatch (" + std::to_string(a.size()) +
                                " vs " + std::to_string(b.size()) + ")");
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

void l2_normalize(std::vector<float>& vec) {
  double norm = 0.0;
  for (float v : vec) {
    norm += static_cast<double>(v) * v;
  }
  if (norm == 0.0) {
    return;
  }
  const double inv = 1.0 / std::sqrt(norm);
  for (float& v : vec) {
    v = static_cast<float>(v * inv);
  }
}

}  // namespace statute_core
