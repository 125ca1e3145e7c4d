#include "../include/components.hpp"
#include <cmath>

void Parameter::initialize_xavier(std::mt19937& gen) {
    const float limit = std::sqrt(6.0f / static_cast<float>(value.rows() + value.cols()));
    value.randomize(-limit, limit, gen);
}

size_t count_parameters(const ParameterList& params) {
    size_t total = 0;
    for (const auto* param : params) {
        total += param->value.size();
    }
    return total;
}

Matrix affine(const Matrix& input, const Parameter& weights, const Parameter& bias) {
    Matrix output = matmul(input, weights.value);
    output.add_bias(bias.value);
    return output;
}

Matrix affine_backward(const Matrix& grad_output, const Matrix& input, Parameter& weights,
                       Parameter& bias) {
    weights.grad += matmul(input.transpose(), grad_output);
    bias.grad += grad_output.column_sum();
    return matmul(grad_output, weights.value.transpose());
}
