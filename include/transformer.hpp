#pragma once
#include "attention.hpp"
#include "context_encoder.hpp"
#include "embeddings.hpp"
#include "feed_forward.hpp"
#include "layer_norm.hpp"
#include <random>
#include <vector>
#include <cereal/types/vector.hpp>

/**
 * @brief Architecture of a TransformerEncoder.
 */
struct TransformerEncoderConfig {
    size_t vocab_size = 0;
    size_t hidden_size = 64;
    size_t num_heads = 4;
    size_t num_layers = 2;
    size_t intermediate_size = 256;
    size_t max_seq_length = 512;
    float layer_norm_epsilon = 1e-5f;

    /**
     * @throws std::invalid_argument if any size is zero or the hidden size is
     *         not divisible by the number of heads
     */
    void validate() const;

    template <class Archive>
    void serialize(Archive& ar) {
        ar(vocab_size, hidden_size, num_heads, num_layers, intermediate_size, max_seq_length,
           layer_norm_epsilon);
    }
};

/**
 * @brief One pre-norm encoder layer.
 *
 * h = x + Attention(LN1(x)); y = h + FFN(LN2(h))
 */
class TransformerLayer {
  private:
    LayerNorm attention_ln;
    MultiHeadAttention self_attention;
    LayerNorm ffn_ln;
    FeedForward feed_forward;

  public:
    TransformerLayer() = default;
    TransformerLayer(const TransformerEncoderConfig& config, std::mt19937& gen);

    Matrix forward(const Matrix& input);
    Matrix backward(const Matrix& grad_output);
    ParameterList parameters();

    template <class Archive>
    void serialize(Archive& ar) {
        ar(attention_ln, self_attention, ffn_ln, feed_forward);
    }
};

/**
 * @brief Bidirectional transformer encoder over sub-word pieces.
 *
 * Piece and position embeddings are summed, passed through the stacked
 * layers and a final layer normalization.
 */
class TransformerEncoder : public PieceEncoder {
  private:
    TransformerEncoderConfig config;
    TokenEmbedding token_embedding;
    PositionalEmbedding position_embedding;
    std::vector<TransformerLayer> layers;
    LayerNorm final_ln;

  public:
    TransformerEncoder() = default;

    /**
     * @param config Architecture; validated
     * @param seed Seed of the weight initialization
     */
    TransformerEncoder(const TransformerEncoderConfig& config, unsigned int seed);

    /**
     * @throws std::runtime_error if the sequence is longer than max_seq_length
     */
    Matrix forward(const std::vector<int>& piece_ids) override;
    Matrix backward(const Matrix& piece_gradients) override;

    size_t output_size() const override {
        return config.hidden_size;
    }

    size_t vocab_size() const override {
        return config.vocab_size;
    }

    size_t max_length() const override {
        return config.max_seq_length;
    }

    ParameterList parameters() override;

    const TransformerEncoderConfig& getConfig() const {
        return config;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(config, token_embedding, position_embedding, layers, final_ln);
    }
};
