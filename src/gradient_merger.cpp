#include "../include/gradient_merger.hpp"
#include <numeric>
#include <stdexcept>

Matrix merge_head_gradients(const std::vector<Matrix>& head_gradients) {
    if (head_gradients.empty()) {
        throw std::invalid_argument("No head gradients to merge");
    }

    Matrix merged = std::accumulate(
        head_gradients.begin() + 1, head_gradients.end(), head_gradients.front(),
        [](Matrix sum, const Matrix& gradient) {
            sum += gradient;
            return sum;
        });
    merged /= static_cast<float>(head_gradients.size());
    return merged;
}
