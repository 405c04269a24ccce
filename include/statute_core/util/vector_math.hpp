#pragma once

#include <vector>

namespace statute_core {

// Zero when either vector has zero norm. Throws std::invalid_argument on size mismatch.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Leaves all-zero vectors untouched.
void l2_normalize(std::vector<float>& vec);

}  // namespace statute_core
