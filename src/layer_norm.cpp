#include "../include/layer_norm.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

LayerNorm::LayerNorm(size_t hidden_size_, float eps_)
    : hidden_size_(hidden_size_),
      eps_(eps_),
      params_{Parameter(1, hidden_size_, 1.0f), Parameter(1, hidden_size_, 0.0f)} {}

Matrix LayerNorm::forward(const Matrix& input) {
    if (input.cols() != hidden_size_) {
        throw std::runtime_error("Input dimension mismatch in LayerNorm: expected " +
                                 std::to_string(hidden_size_) + " features, got " +
                                 std::to_string(input.cols()));
    }

    const size_t rows = input.rows();
    const size_t cols = input.cols();
    normalized_cache_ = Matrix(rows, cols);
    inv_std_cache_.assign(rows, 0.0f);
    Matrix output(rows, cols);

#pragma omp parallel for
    for (size_t i = 0; i < rows; i++) {
        float mean = 0.0f;
        for (size_t j = 0; j < cols; j++) {
            mean += input(i, j);
        }
        mean /= static_cast<float>(cols);

        float var = 0.0f;
        for (size_t j = 0; j < cols; j++) {
            float diff = input(i, j) - mean;
            var += diff * diff;
        }
        var /= static_cast<float>(cols);

        const float inv_std = 1.0f / std::sqrt(var + eps_);
        inv_std_cache_[i] = inv_std;
        for (size_t j = 0; j < cols; j++) {
            float normalized = (input(i, j) - mean) * inv_std;
            normalized_cache_(i, j) = normalized;
            output(i, j) = params_.gamma.value(0, j) * normalized + params_.beta.value(0, j);
        }
    }
    return output;
}

Matrix LayerNorm::backward(const Matrix& grad_output) {
    if (grad_output.rows() != normalized_cache_.rows() || grad_output.cols() != hidden_size_) {
        throw std::runtime_error("LayerNorm backward called with a gradient of the wrong shape");
    }

    const size_t rows = grad_output.rows();
    const size_t cols = grad_output.cols();
    Matrix grad_input(rows, cols);

    for (size_t i = 0; i < rows; i++) {
        float mean_grad = 0.0f;
        float mean_grad_x = 0.0f;
        for (size_t j = 0; j < cols; j++) {
            const float dy = grad_output(i, j);
            const float x_hat = normalized_cache_(i, j);
            params_.gamma.grad(0, j) += dy * x_hat;
            params_.beta.grad(0, j) += dy;

            const float dx_hat = dy * params_.gamma.value(0, j);
            mean_grad += dx_hat;
            mean_grad_x += dx_hat * x_hat;
        }
        mean_grad /= static_cast<float>(cols);
        mean_grad_x /= static_cast<float>(cols);

        for (size_t j = 0; j < cols; j++) {
            const float dx_hat = grad_output(i, j) * params_.gamma.value(0, j);
            grad_input(i, j) = inv_std_cache_[i] *
                               (dx_hat - mean_grad - normalized_cache_(i, j) * mean_grad_x);
        }
    }
    return grad_input;
}
