#include "../include/transformer.hpp"
#include <stdexcept>
#include <string>

void TransformerEncoderConfig::validate() const {
    if (vocab_size == 0 || hidden_size == 0 || num_heads == 0 || num_layers == 0 ||
        intermediate_size == 0 || max_seq_length == 0) {
        throw std::invalid_argument("Transformer sizes must all be positive");
    }
    if (hidden_size % num_heads != 0) {
        throw std::invalid_argument("Hidden size must be divisible by number of heads");
    }
    if (layer_norm_epsilon <= 0.0f) {
        throw std::invalid_argument("Layer norm epsilon must be positive");
    }
}

TransformerLayer::TransformerLayer(const TransformerEncoderConfig& config, std::mt19937& gen)
    : attention_ln(config.hidden_size, config.layer_norm_epsilon),
      self_attention(config.hidden_size, config.num_heads, gen),
      ffn_ln(config.hidden_size, config.layer_norm_epsilon),
      feed_forward(config.hidden_size, config.intermediate_size, gen) {}

Matrix TransformerLayer::forward(const Matrix& input) {
    Matrix residual = input + self_attention.forward(attention_ln.forward(input));
    return residual + feed_forward.forward(ffn_ln.forward(residual));
}

Matrix TransformerLayer::backward(const Matrix& grad_output) {
    Matrix grad_residual = grad_output + ffn_ln.backward(feed_forward.backward(grad_output));
    return grad_residual + attention_ln.backward(self_attention.backward(grad_residual));
}

ParameterList TransformerLayer::parameters() {
    ParameterList params;
    append_parameters(params, attention_ln.parameters());
    append_parameters(params, self_attention.parameters());
    append_parameters(params, ffn_ln.parameters());
    append_parameters(params, feed_forward.parameters());
    return params;
}

TransformerEncoder::TransformerEncoder(const TransformerEncoderConfig& config_, unsigned int seed)
    : config(config_) {
    config.validate();

    std::mt19937 gen(seed);
    token_embedding = TokenEmbedding(config.vocab_size, config.hidden_size, gen);
    position_embedding = PositionalEmbedding(config.max_seq_length, config.hidden_size, gen);
    layers.reserve(config.num_layers);
    for (size_t i = 0; i < config.num_layers; ++i) {
        layers.emplace_back(config, gen);
    }
    final_ln = LayerNorm(config.hidden_size, config.layer_norm_epsilon);
}

Matrix TransformerEncoder::forward(const std::vector<int>& piece_ids) {
    try {
        Matrix hidden = token_embedding.forward(piece_ids);
        hidden += position_embedding.forward(piece_ids.size());
        for (auto& layer : layers) {
            hidden = layer.forward(hidden);
        }
        return final_ln.forward(hidden);
    } catch (const std::exception& e) {
        throw std::runtime_error("Transformer encoder forward failed: " + std::string(e.what()));
    }
}

Matrix TransformerEncoder::backward(const Matrix& piece_gradients) {
    Matrix grad = final_ln.backward(piece_gradients);
    for (auto it = layers.rbegin(); it != layers.rend(); ++it) {
        grad = it->backward(grad);
    }
    token_embedding.backward(grad);
    position_embedding.backward(grad);
    return grad;
}

ParameterList TransformerEncoder::parameters() {
    ParameterList params;
    append_parameters(params, token_embedding.parameters());
    append_parameters(params, position_embedding.parameters());
    for (auto& layer : layers) {
        append_parameters(params, layer.parameters());
    }
    append_parameters(params, final_ln.parameters());
    return params;
}
