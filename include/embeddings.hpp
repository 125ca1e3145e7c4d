#pragma once
#include "components.hpp"
#include <random>
#include <vector>

/**
 * @brief Trainable lookup table from token ids to dense vectors.
 */
class TokenEmbedding {
  private:
    Parameter weights_;        ///< Embedding table of shape [vocab_size, embedding_dim]
    size_t vocab_size_ = 0;    ///< Size of the vocabulary
    size_t embedding_dim_ = 0; ///< Dimension of each embedding vector
    std::vector<int> input_cache_;

  public:
    TokenEmbedding() = default;

    /**
     * @brief Creates an embedding table with small uniform random values.
     */
    TokenEmbedding(size_t vocab_size, size_t embedding_dim, std::mt19937& gen);

    /**
     * @brief Looks up the embedding of each id.
     * @return Matrix of shape [tokens.size(), embedding_dim]
     * @throws std::out_of_range for ids outside the vocabulary
     */
    Matrix forward(const std::vector<int>& tokens);

    /**
     * @brief Accumulates the gradients of the rows used by the last forward().
     */
    void backward(const Matrix& grad_output);

    ParameterList parameters() {
        return {&weights_};
    }

    const Matrix& get_embedding_table() const {
        return weights_.value;
    }

    size_t get_vocab_size() const {
        return vocab_size_;
    }

    size_t get_embedding_dim() const {
        return embedding_dim_;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(vocab_size_, embedding_dim_, weights_);
    }
};

/**
 * @brief Learned absolute position embeddings (one row per position).
 */
class PositionalEmbedding {
  private:
    Parameter weights_;          ///< Table of shape [max_seq_length, embedding_dim]
    size_t max_seq_length_ = 0;
    size_t embedding_dim_ = 0;
    size_t length_cache_ = 0;

  public:
    PositionalEmbedding() = default;
    PositionalEmbedding(size_t max_seq_length, size_t embedding_dim, std::mt19937& gen);

    /**
     * @brief Embeddings of positions 0 .. seq_length - 1.
     * @throws std::runtime_error if seq_length exceeds the maximum length
     */
    Matrix forward(size_t seq_length);

    void backward(const Matrix& grad_output);

    ParameterList parameters() {
        return {&weights_};
    }

    size_t get_max_seq_length() const {
        return max_seq_length_;
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(max_seq_length_, embedding_dim_, weights_);
    }
};
