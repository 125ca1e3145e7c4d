#pragma once
#include "components.hpp"
#include <vector>

/**
 * @brief Layer Normalization over the feature dimension.
 *
 * Each row is normalized independently, then scaled and shifted by the
 * learnable gamma and beta:
 * y = ((x - mean) / sqrt(variance + eps)) * gamma + beta
 */
class LayerNorm {
public:
    LayerNorm() = default;

    /**
     * @brief Constructs a layer normalization module.
     * @param hidden_size_ Size of the input features
     * @param eps_ Small constant for numerical stability (default: 1e-5)
     */
    LayerNorm(size_t hidden_size_, float eps_ = 1e-5f);

    /**
     * @brief Normalizes every row of the input.
     * @param input Matrix of shape [seq_len, hidden_size]
     * @return Normalized matrix of the same shape
     * @throws std::runtime_error on a feature size mismatch
     */
    Matrix forward(const Matrix& input);

    /**
     * @brief Backward pass for the last forward() call.
     *
     * Accumulates the gamma and beta gradients.
     *
     * @param grad_output Gradient of the loss with respect to the output
     * @return Gradient with respect to the input
     */
    Matrix backward(const Matrix& grad_output);

    ParameterList parameters() {
        return {&params_.gamma, &params_.beta};
    }

    size_t get_hidden_size() const {
        return hidden_size_;
    }

    float get_eps() const {
        return eps_;
    }

    // Parameter structure to hold gamma and beta
    struct Parameters {
        Parameter gamma;  // Scale parameter
        Parameter beta;   // Shift parameter
    };

    const Parameters& get_parameters() const {
        return params_;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(hidden_size_, eps_, params_.gamma, params_.beta);
    }

private:
    size_t hidden_size_ = 0;
    float eps_ = 1e-5f;
    Parameters params_;
    Matrix normalized_cache_;         // x_hat of the last forward pass
    std::vector<float> inv_std_cache_;  // 1 / sqrt(var + eps) per row
};
