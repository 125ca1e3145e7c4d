#pragma once
#include "components.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <random>
#include <string>
#include <gtest/gtest.h>

// Finite-difference checks of backward passes against the scalar
// L = sum(forward(x) * R) for a fixed random R.
namespace gradient_check {

constexpr float kEpsilon = 1e-2f;
constexpr float kTolerance = 2e-2f;

inline Matrix random_matrix(size_t rows, size_t cols, unsigned int seed, float scale = 1.0f) {
    std::mt19937 gen(seed);
    Matrix m(rows, cols);
    m.randomize(-scale, scale, gen);
    return m;
}

inline float weighted_sum(const Matrix& output, const Matrix& weights) {
    float sum = 0.0f;
    for (size_t r = 0; r < output.rows(); ++r) {
        for (size_t c = 0; c < output.cols(); ++c) {
            sum += output(r, c) * weights(r, c);
        }
    }
    return sum;
}

inline void expect_close(float analytic, float numeric, const std::string& what) {
    float scale = std::max(1.0f, std::max(std::fabs(analytic), std::fabs(numeric)));
    EXPECT_NEAR(analytic, numeric, kTolerance * scale) << what;
}

using Forward = std::function<Matrix(const Matrix&)>;
using Backward = std::function<Matrix(const Matrix&)>;

inline void check_input_gradient(const Forward& forward, const Backward& backward, Matrix input,
                                 unsigned int seed = 11) {
    Matrix output = forward(input);
    Matrix weights = random_matrix(output.rows(), output.cols(), seed);
    forward(input);
    Matrix analytic = backward(weights);
    ASSERT_EQ(analytic.rows(), input.rows());
    ASSERT_EQ(analytic.cols(), input.cols());

    for (size_t r = 0; r < input.rows(); ++r) {
        for (size_t c = 0; c < input.cols(); ++c) {
            float original = input(r, c);
            input(r, c) = original + kEpsilon;
            float plus = weighted_sum(forward(input), weights);
            input(r, c) = original - kEpsilon;
            float minus = weighted_sum(forward(input), weights);
            input(r, c) = original;
            expect_close(analytic(r, c), (plus - minus) / (2.0f * kEpsilon),
                         "input(" + std::to_string(r) + ", " + std::to_string(c) + ")");
        }
    }
}

inline void check_parameter_gradient(const Forward& forward, const Backward& backward,
                                     const Matrix& input, Parameter& param,
                                     unsigned int seed = 13) {
    Matrix output = forward(input);
    Matrix weights = random_matrix(output.rows(), output.cols(), seed);
    param.zero_grad();
    forward(input);
    backward(weights);
    Matrix analytic = param.grad;

    // A bounded sample of entries keeps large matrices fast
    size_t stride = std::max<size_t>(1, param.value.size() / 40);
    for (size_t k = 0; k < param.value.size(); k += stride) {
        size_t r = k / param.value.cols();
        size_t c = k % param.value.cols();
        float original = param.value(r, c);
        param.value(r, c) = original + kEpsilon;
        float plus = weighted_sum(forward(input), weights);
        param.value(r, c) = original - kEpsilon;
        float minus = weighted_sum(forward(input), weights);
        param.value(r, c) = original;
        expect_close(analytic(r, c), (plus - minus) / (2.0f * kEpsilon),
                     "param(" + std::to_string(r) + ", " + std::to_string(c) + ")");
    }
}

}  // namespace gradient_check
