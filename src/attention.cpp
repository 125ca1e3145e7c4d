#include "../include/attention.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

MultiHeadAttention::MultiHeadAttention(size_t hidden_size_, size_t num_heads_, std::mt19937& gen)
    : num_heads(num_heads_), hidden_size(hidden_size_) {
    if (num_heads_ == 0 || hidden_size_ % num_heads_ != 0) {
        throw std::invalid_argument("Hidden size " + std::to_string(hidden_size_) +
                                    " must be divisible by number of heads " +
                                    std::to_string(num_heads_));
    }
    head_dim = hidden_size_ / num_heads_;

    params_.query_weights = Parameter(hidden_size_, hidden_size_);
    params_.key_weights = Parameter(hidden_size_, hidden_size_);
    params_.value_weights = Parameter(hidden_size_, hidden_size_);
    params_.output_weights = Parameter(hidden_size_, hidden_size_);
    params_.query_bias = Parameter(1, hidden_size_);
    params_.key_bias = Parameter(1, hidden_size_);
    params_.value_bias = Parameter(1, hidden_size_);
    params_.output_bias = Parameter(1, hidden_size_);

    params_.query_weights.initialize_xavier(gen);
    params_.key_weights.initialize_xavier(gen);
    params_.value_weights.initialize_xavier(gen);
    params_.output_weights.initialize_xavier(gen);
}

Matrix MultiHeadAttention::head_slice(const Matrix& m, size_t head) const {
    Matrix slice(m.rows(), head_dim);
    const size_t offset = head * head_dim;
    for (size_t i = 0; i < m.rows(); ++i) {
        for (size_t j = 0; j < head_dim; ++j) {
            slice(i, j) = m(i, offset + j);
        }
    }
    return slice;
}

void MultiHeadAttention::write_head_slice(Matrix& m, const Matrix& slice, size_t head) const {
    const size_t offset = head * head_dim;
    for (size_t i = 0; i < m.rows(); ++i) {
        for (size_t j = 0; j < head_dim; ++j) {
            m(i, offset + j) = slice(i, j);
        }
    }
}

Matrix MultiHeadAttention::forward(const Matrix& x) {
    if (x.cols() != hidden_size) {
        throw std::runtime_error("Input dimension mismatch in MultiHeadAttention: expected " +
                                 std::to_string(hidden_size) + ", got " +
                                 std::to_string(x.cols()));
    }

    input_cache_ = x;
    query_cache_ = affine(x, params_.query_weights, params_.query_bias);
    key_cache_ = affine(x, params_.key_weights, params_.key_bias);
    value_cache_ = affine(x, params_.value_weights, params_.value_bias);

    const float scale = 1.0f / std::sqrt(static_cast<float>(head_dim));
    context_cache_ = Matrix(x.rows(), hidden_size);
    attention_probs_.assign(num_heads, Matrix());

    for (size_t h = 0; h < num_heads; ++h) {
        Matrix q = head_slice(query_cache_, h);
        Matrix k = head_slice(key_cache_, h);
        Matrix v = head_slice(value_cache_, h);

        Matrix scores = matmul(q, k.transpose());
        scores *= scale;
        scores.apply_softmax();

        write_head_slice(context_cache_, matmul(scores, v), h);
        attention_probs_[h] = std::move(scores);
    }

    return affine(context_cache_, params_.output_weights, params_.output_bias);
}

Matrix MultiHeadAttention::backward(const Matrix& grad_output) {
    if (grad_output.rows() != input_cache_.rows() || grad_output.cols() != hidden_size) {
        throw std::runtime_error("MultiHeadAttention backward called with a gradient of the "
                                 "wrong shape");
    }

    const float scale = 1.0f / std::sqrt(static_cast<float>(head_dim));
    Matrix grad_context =
        affine_backward(grad_output, context_cache_, params_.output_weights, params_.output_bias);

    Matrix grad_query(input_cache_.rows(), hidden_size);
    Matrix grad_key(input_cache_.rows(), hidden_size);
    Matrix grad_value(input_cache_.rows(), hidden_size);

    for (size_t h = 0; h < num_heads; ++h) {
        const Matrix& probs = attention_probs_[h];
        Matrix q = head_slice(query_cache_, h);
        Matrix k = head_slice(key_cache_, h);
        Matrix v = head_slice(value_cache_, h);
        Matrix grad_out_h = head_slice(grad_context, h);

        Matrix grad_probs = matmul(grad_out_h, v.transpose());
        write_head_slice(grad_value, matmul(probs.transpose(), grad_out_h), h);

        // Softmax backward, row by row
        Matrix grad_scores(probs.rows(), probs.cols());
        for (size_t i = 0; i < probs.rows(); ++i) {
            float dot = 0.0f;
            for (size_t j = 0; j < probs.cols(); ++j) {
                dot += grad_probs(i, j) * probs(i, j);
            }
            for (size_t j = 0; j < probs.cols(); ++j) {
                grad_scores(i, j) = probs(i, j) * (grad_probs(i, j) - dot) * scale;
            }
        }

        write_head_slice(grad_query, matmul(grad_scores, k), h);
        write_head_slice(grad_key, matmul(grad_scores.transpose(), q), h);
    }

    Matrix grad_input =
        affine_backward(grad_query, input_cache_, params_.query_weights, params_.query_bias);
    grad_input += affine_backward(grad_key, input_cache_, params_.key_weights, params_.key_bias);
    grad_input +=
        affine_backward(grad_value, input_cache_, params_.value_weights, params_.value_bias);
    return grad_input;
}
