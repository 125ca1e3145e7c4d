#include "../include/embeddings.hpp"
#include <stdexcept>
#include <string>

namespace {
constexpr float EMBEDDING_INIT_RANGE = 0.1f;
}

TokenEmbedding::TokenEmbedding(size_t vocab_size, size_t embedding_dim, std::mt19937& gen)
    : weights_(vocab_size, embedding_dim), vocab_size_(vocab_size), embedding_dim_(embedding_dim) {
    weights_.value.randomize(-EMBEDDING_INIT_RANGE, EMBEDDING_INIT_RANGE, gen);
}

Matrix TokenEmbedding::forward(const std::vector<int>& tokens) {
    Matrix output(tokens.size(), embedding_dim_);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] < 0 || static_cast<size_t>(tokens[i]) >= vocab_size_) {
            throw std::out_of_range("Token id " + std::to_string(tokens[i]) +
                                    " out of range for vocabulary size " +
                                    std::to_string(vocab_size_));
        }
        output.set_row(i, weights_.value.row(static_cast<size_t>(tokens[i])));
    }
    input_cache_ = tokens;
    return output;
}

void TokenEmbedding::backward(const Matrix& grad_output) {
    if (grad_output.rows() != input_cache_.size() || grad_output.cols() != embedding_dim_) {
        throw std::runtime_error("TokenEmbedding backward called with a gradient of the wrong "
                                 "shape");
    }
    for (size_t i = 0; i < input_cache_.size(); ++i) {
        weights_.grad.add_to_row(static_cast<size_t>(input_cache_[i]), grad_output.row(i));
    }
}

PositionalEmbedding::PositionalEmbedding(size_t max_seq_length, size_t embedding_dim,
                                         std::mt19937& gen)
    : weights_(max_seq_length, embedding_dim),
      max_seq_length_(max_seq_length),
      embedding_dim_(embedding_dim) {
    weights_.value.randomize(-EMBEDDING_INIT_RANGE, EMBEDDING_INIT_RANGE, gen);
}

Matrix PositionalEmbedding::forward(size_t seq_length) {
    if (seq_length > max_seq_length_) {
        throw std::runtime_error("Sequence of " + std::to_string(seq_length) +
                                 " pieces exceeds the maximum length " +
                                 std::to_string(max_seq_length_));
    }
    Matrix output(seq_length, embedding_dim_);
    for (size_t i = 0; i < seq_length; ++i) {
        output.set_row(i, weights_.value.row(i));
    }
    length_cache_ = seq_length;
    return output;
}

void PositionalEmbedding::backward(const Matrix& grad_output) {
    if (grad_output.rows() != length_cache_ || grad_output.cols() != embedding_dim_) {
        throw std::runtime_error("PositionalEmbedding backward called with a gradient of the "
                                 "wrong shape");
    }
    for (size_t i = 0; i < length_cache_; ++i) {
        weights_.grad.add_to_row(i, grad_output.row(i));
    }
}
