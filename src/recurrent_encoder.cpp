#include "../include/recurrent_encoder.hpp"
#include <cmath>
#include <stdexcept>

RecurrentLayer::RecurrentLayer(size_t input_size, size_t hidden_size, bool reverse_,
                               std::mt19937& gen)
    : input_weights(input_size, hidden_size),
      recurrent_weights(hidden_size, hidden_size),
      bias(1, hidden_size),
      reverse(reverse_) {
    input_weights.initialize_xavier(gen);
    recurrent_weights.initialize_xavier(gen);
}

Matrix RecurrentLayer::forward(const Matrix& input) {
    const size_t steps = input.rows();
    const size_t hidden = hidden_size();

    // Input projections for all steps at once
    Matrix projected = matmul(input, input_weights.value);
    projected.add_bias(bias.value);

    hidden_cache_ = Matrix(steps, hidden);
    for (size_t s = 0; s < steps; ++s) {
        const size_t t = reverse ? steps - 1 - s : s;
        Vector state = projected.row(t);
        if (s > 0) {
            const size_t prev = reverse ? t + 1 : t - 1;
            for (size_t k = 0; k < hidden; ++k) {
                const float h_k = hidden_cache_(prev, k);
                for (size_t j = 0; j < hidden; ++j) {
                    state[j] += h_k * recurrent_weights.value(k, j);
                }
            }
        }
        for (auto& value : state) {
            value = std::tanh(value);
        }
        hidden_cache_.set_row(t, state);
    }

    input_cache_ = input;
    return hidden_cache_;
}

Matrix RecurrentLayer::backward(const Matrix& grad_output) {
    const size_t steps = hidden_cache_.rows();
    const size_t hidden = hidden_size();
    if (grad_output.rows() != steps || grad_output.cols() != hidden) {
        throw std::runtime_error("RecurrentLayer backward called with a gradient of the wrong "
                                 "shape");
    }

    // Gradients with respect to the pre-activations of every step
    Matrix grad_pre(steps, hidden);
    Vector carry(hidden);
    for (size_t s = steps; s-- > 0;) {
        const size_t t = reverse ? steps - 1 - s : s;
        for (size_t j = 0; j < hidden; ++j) {
            const float h = hidden_cache_(t, j);
            grad_pre(t, j) = (grad_output(t, j) + carry[j]) * (1.0f - h * h);
        }

        carry.fill(0.0f);
        if (s > 0) {
            const size_t prev = reverse ? t + 1 : t - 1;
            for (size_t k = 0; k < hidden; ++k) {
                const float h_k = hidden_cache_(prev, k);
                for (size_t j = 0; j < hidden; ++j) {
                    recurrent_weights.grad(k, j) += h_k * grad_pre(t, j);
                    carry[k] += grad_pre(t, j) * recurrent_weights.value(k, j);
                }
            }
        }
    }

    return affine_backward(grad_pre, input_cache_, input_weights, bias);
}

BiRNN::BiRNN(size_t input_size, size_t hidden_size, std::mt19937& gen)
    : forward_layer(input_size, hidden_size, false, gen),
      backward_layer(input_size, hidden_size, true, gen) {}

Matrix BiRNN::forward(const Matrix& input) {
    Matrix left = forward_layer.forward(input);
    Matrix right = backward_layer.forward(input);

    const size_t hidden = left.cols();
    Matrix output(input.rows(), 2 * hidden);
    for (size_t i = 0; i < input.rows(); ++i) {
        for (size_t j = 0; j < hidden; ++j) {
            output(i, j) = left(i, j);
            output(i, hidden + j) = right(i, j);
        }
    }
    return output;
}

Matrix BiRNN::backward(const Matrix& grad_output) {
    const size_t hidden = forward_layer.hidden_size();
    if (grad_output.cols() != 2 * hidden) {
        throw std::runtime_error("BiRNN backward called with a gradient of the wrong shape");
    }

    Matrix grad_left(grad_output.rows(), hidden);
    Matrix grad_right(grad_output.rows(), hidden);
    for (size_t i = 0; i < grad_output.rows(); ++i) {
        for (size_t j = 0; j < hidden; ++j) {
            grad_left(i, j) = grad_output(i, j);
            grad_right(i, j) = grad_output(i, hidden + j);
        }
    }

    Matrix grad_input = forward_layer.backward(grad_left);
    grad_input += backward_layer.backward(grad_right);
    return grad_input;
}

ParameterList BiRNN::parameters() {
    ParameterList params = forward_layer.parameters();
    append_parameters(params, backward_layer.parameters());
    return params;
}

RecurrentContextEncoder::RecurrentContextEncoder(EmbeddingTokensEncoder tokens_encoder,
                                                 size_t hidden_size, unsigned int seed)
    : tokens_encoder_(std::move(tokens_encoder)) {
    if (hidden_size == 0) {
        throw std::invalid_argument("Recurrent hidden size must be positive");
    }
    std::mt19937 gen(seed);
    birnn_ = BiRNN(tokens_encoder_.output_size(), hidden_size, gen);
}

Matrix RecurrentContextEncoder::forward(const Sentence& sentence) {
    return birnn_.forward(tokens_encoder_.forward(sentence));
}

Matrix RecurrentContextEncoder::backward(const Matrix& token_gradients) {
    Matrix grad_encodings = birnn_.backward(token_gradients);
    tokens_encoder_.backward(grad_encodings);
    return grad_encodings;
}

ParameterList RecurrentContextEncoder::parameters() {
    ParameterList params = tokens_encoder_.parameters();
    append_parameters(params, birnn_.parameters());
    return params;
}
