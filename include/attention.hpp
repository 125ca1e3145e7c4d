#pragma once
#include "components.hpp"
#include <random>
#include <vector>

/**
 * @brief Bidirectional multi-head self-attention.
 *
 * Every position attends to every position of the same sequence, with no
 * mask: the predictor always sees the whole sentence. The hidden size is
 * split evenly across heads; the concatenated head outputs are projected
 * back to the hidden size.
 */
class MultiHeadAttention {
  public:
    MultiHeadAttention() = default;

    /**
     * @brief Constructs a multi-head attention layer.
     * @param hidden_size_ Size of input and output features
     * @param num_heads_ Number of attention heads
     * @param gen Random generator used for initialization
     * @throws std::invalid_argument if hidden_size_ is not divisible by num_heads_
     */
    MultiHeadAttention(size_t hidden_size_, size_t num_heads_, std::mt19937& gen);

    /**
     * @brief Forward pass over one sequence.
     * @param x Matrix of shape [seq_len, hidden_size]
     * @return Matrix of shape [seq_len, hidden_size]
     */
    Matrix forward(const Matrix& x);

    /**
     * @brief Backward pass for the last forward() call.
     *
     * Accumulates the projection gradients.
     *
     * @param grad_output Gradient with respect to the output
     * @return Gradient with respect to the input
     */
    Matrix backward(const Matrix& grad_output);

    ParameterList parameters() {
        return {&params_.query_weights, &params_.query_bias, &params_.key_weights,
                &params_.key_bias,      &params_.value_weights, &params_.value_bias,
                &params_.output_weights, &params_.output_bias};
    }

    size_t get_num_heads() const {
        return num_heads;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(num_heads, head_dim, hidden_size, params_.query_weights, params_.query_bias,
           params_.key_weights, params_.key_bias, params_.value_weights, params_.value_bias,
           params_.output_weights, params_.output_bias);
    }

  private:
    // Parameter structure to hold all weights and biases
    struct Parameters {
        Parameter query_weights;
        Parameter query_bias;
        Parameter key_weights;
        Parameter key_bias;
        Parameter value_weights;
        Parameter value_bias;
        Parameter output_weights;
        Parameter output_bias;
    };

    size_t num_heads = 0;    ///< Number of attention heads
    size_t head_dim = 0;     ///< Dimension of each attention head
    size_t hidden_size = 0;  ///< Size of input and output tensors
    Parameters params_;

    // Forward caches
    Matrix input_cache_;
    Matrix query_cache_;
    Matrix key_cache_;
    Matrix value_cache_;
    Matrix context_cache_;                 ///< Concatenated head outputs
    std::vector<Matrix> attention_probs_;  ///< Softmax weights per head

    Matrix head_slice(const Matrix& m, size_t head) const;
    void write_head_slice(Matrix& m, const Matrix& slice, size_t head) const;
};
