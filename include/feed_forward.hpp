#pragma once
#include "components.hpp"
#include <random>

/**
 * @brief Position-wise feed-forward block of a transformer layer.
 *
 * y = GELU(x W1 + b1) W2 + b2, applied to every row independently.
 */
class FeedForward {
  private:
    // Parameter structure to hold all weights and biases
    struct Parameters {
        Parameter ff1_weights;
        Parameter ff1_bias;
        Parameter ff2_weights;
        Parameter ff2_bias;
    };

    Parameters params_;

    // Cache for intermediate values
    Matrix input_cache_;         ///< Input of the last forward pass
    Matrix preactivation_cache_; ///< x W1 + b1 of the last forward pass
    Matrix intermediate_cache_;  ///< GELU activations of the last forward pass

  public:
    FeedForward() = default;

    /**
     * @brief Constructs a feed-forward block with Xavier-initialized weights.
     * @param input_size Size of the input and output features
     * @param hidden_size Size of the intermediate layer
     * @param gen Random generator used for initialization
     */
    FeedForward(size_t input_size, size_t hidden_size, std::mt19937& gen);

    /**
     * @brief Forward pass.
     * @param input Matrix of shape [seq_len, input_size]
     * @return Matrix of shape [seq_len, input_size]
     */
    Matrix forward(const Matrix& input);

    /**
     * @brief Backward pass for the last forward() call.
     *
     * Accumulates the weight and bias gradients.
     *
     * @param grad_output Gradient with respect to the output
     * @return Gradient with respect to the input
     */
    Matrix backward(const Matrix& grad_output);

    ParameterList parameters() {
        return {&params_.ff1_weights, &params_.ff1_bias, &params_.ff2_weights, &params_.ff2_bias};
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(params_.ff1_weights, params_.ff1_bias, params_.ff2_weights, params_.ff2_bias);
    }

    // tanh approximation of the Gaussian error linear unit
    static float gelu(float x);
    static float gelu_derivative(float x);
};
