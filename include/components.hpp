#pragma once
#include "matrix.hpp"
#include <random>
#include <string>
#include <vector>

/**
 * @file components.hpp
 * @brief Shared building blocks for the trainable layers.
 *
 * Every layer stores its weights as Parameter objects: the value matrix
 * together with the gradient accumulated by backward passes. Layers expose
 * their parameters as a flat list of pointers so that the optimizer can
 * update any composition of layers uniformly.
 */

/**
 * @brief A trainable matrix and its accumulated gradient.
 *
 * Only the value is serialized; the gradient is reset to zeros on load.
 */
struct Parameter {
    Matrix value;
    Matrix grad;

    Parameter() = default;
    Parameter(size_t rows, size_t cols, float init_val = 0.0f)
        : value(rows, cols, init_val), grad(rows, cols) {}

    void zero_grad() {
        grad.fill(0.0f);
    }

    /**
     * @brief Xavier/Glorot uniform initialization of the value.
     */
    void initialize_xavier(std::mt19937& gen);

    template <class Archive>
    void save(Archive& ar) const {
        ar(value);
    }

    template <class Archive>
    void load(Archive& ar) {
        ar(value);
        grad = Matrix(value.rows(), value.cols());
    }
};

using ParameterList = std::vector<Parameter*>;

/**
 * @brief Appends all parameters of `from` to `into`.
 */
inline void append_parameters(ParameterList& into, const ParameterList& from) {
    into.insert(into.end(), from.begin(), from.end());
}

/**
 * @brief Total number of trainable scalars in a parameter list.
 */
size_t count_parameters(const ParameterList& params);

/**
 * @brief input x weights + bias, with the bias broadcast over rows.
 */
Matrix affine(const Matrix& input, const Parameter& weights, const Parameter& bias);

/**
 * @brief Backward of affine().
 *
 * Accumulates the weight and bias gradients and returns the gradient with
 * respect to the input.
 */
Matrix affine_backward(const Matrix& grad_output, const Matrix& input, Parameter& weights,
                       Parameter& bias);
