#include "../include/feed_forward.hpp"
#include <cmath>

namespace {
constexpr float SQRT_2_OVER_PI = 0.7978845608028654f;
constexpr float GELU_CUBIC = 0.044715f;
}

FeedForward::FeedForward(size_t input_size, size_t hidden_size, std::mt19937& gen)
    : params_{Parameter(input_size, hidden_size), Parameter(1, hidden_size),
              Parameter(hidden_size, input_size), Parameter(1, input_size)} {
    params_.ff1_weights.initialize_xavier(gen);
    params_.ff2_weights.initialize_xavier(gen);
}

float FeedForward::gelu(float x) {
    return 0.5f * x * (1.0f + std::tanh(SQRT_2_OVER_PI * (x + GELU_CUBIC * x * x * x)));
}

float FeedForward::gelu_derivative(float x) {
    const float t = std::tanh(SQRT_2_OVER_PI * (x + GELU_CUBIC * x * x * x));
    const float dt = (1.0f - t * t) * SQRT_2_OVER_PI * (1.0f + 3.0f * GELU_CUBIC * x * x);
    return 0.5f * (1.0f + t) + 0.5f * x * dt;
}

Matrix FeedForward::forward(const Matrix& input) {
    input_cache_ = input;
    preactivation_cache_ = affine(input, params_.ff1_weights, params_.ff1_bias);

    intermediate_cache_ = Matrix(preactivation_cache_.rows(), preactivation_cache_.cols());
    for (size_t i = 0; i < preactivation_cache_.size(); ++i) {
        intermediate_cache_.data()[i] = gelu(preactivation_cache_.data()[i]);
    }

    return affine(intermediate_cache_, params_.ff2_weights, params_.ff2_bias);
}

Matrix FeedForward::backward(const Matrix& grad_output) {
    Matrix grad_intermediate =
        affine_backward(grad_output, intermediate_cache_, params_.ff2_weights, params_.ff2_bias);

    for (size_t i = 0; i < grad_intermediate.size(); ++i) {
        grad_intermediate.data()[i] *= gelu_derivative(preactivation_cache_.data()[i]);
    }

    return affine_backward(grad_intermediate, input_cache_, params_.ff1_weights, params_.ff1_bias);
}
