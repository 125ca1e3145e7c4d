#pragma once
#include "components.hpp"
#include "context_encoder.hpp"
#include "tokens_encoder.hpp"
#include <random>

/**
 * @brief Single-direction Elman recurrent layer.
 *
 * h_t = tanh(x_t Wx + h_prev Wh + b), where h_prev is the previous step in
 * reading order (left to right, or right to left when `reverse` is set) and
 * the initial state is zero.
 */
class RecurrentLayer {
  private:
    Parameter input_weights;
    Parameter recurrent_weights;
    Parameter bias;
    bool reverse = false;

    Matrix input_cache_;
    Matrix hidden_cache_;

  public:
    RecurrentLayer() = default;
    RecurrentLayer(size_t input_size, size_t hidden_size, bool reverse, std::mt19937& gen);

    /**
     * @return Matrix of shape [seq_len, hidden_size]
     */
    Matrix forward(const Matrix& input);

    /**
     * @brief Back-propagation through time for the last forward() call.
     * @return Gradient with respect to the input
     */
    Matrix backward(const Matrix& grad_output);

    ParameterList parameters() {
        return {&input_weights, &recurrent_weights, &bias};
    }

    size_t hidden_size() const {
        return bias.value.cols();
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(input_weights, recurrent_weights, bias, reverse);
    }
};

/**
 * @brief Bidirectional recurrent encoder: left-to-right and right-to-left
 * states concatenated per position.
 */
class BiRNN {
  private:
    RecurrentLayer forward_layer;
    RecurrentLayer backward_layer;

  public:
    BiRNN() = default;
    BiRNN(size_t input_size, size_t hidden_size, std::mt19937& gen);

    /**
     * @return Matrix of shape [seq_len, 2 * hidden_size]
     */
    Matrix forward(const Matrix& input);
    Matrix backward(const Matrix& grad_output);

    ParameterList parameters();

    size_t output_size() const {
        return 2 * forward_layer.hidden_size();
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(forward_layer, backward_layer);
    }
};

/**
 * @brief Token-level context encoder: token encodings fed to a BiRNN.
 *
 * No sub-word aggregation takes place; the token gradients reach the BiRNN
 * unchanged and the BiRNN input gradients reach the tokens encoder.
 */
class RecurrentContextEncoder : public ContextEncoder {
  public:
    RecurrentContextEncoder() = default;
    RecurrentContextEncoder(EmbeddingTokensEncoder tokens_encoder, size_t hidden_size,
                            unsigned int seed);

    Matrix forward(const Sentence& sentence) override;

    /**
     * @return Gradient with respect to the token encodings
     */
    Matrix backward(const Matrix& token_gradients) override;

    size_t output_size() const override {
        return birnn_.output_size();
    }

    ParameterList parameters() override;

    const EmbeddingTokensEncoder& tokens_encoder() const {
        return tokens_encoder_;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(tokens_encoder_, birnn_);
    }

  private:
    EmbeddingTokensEncoder tokens_encoder_;
    BiRNN birnn_;
};
