#include "../include/tokens_encoder.hpp"
#include "../include/utils.hpp"
#include <random>
#include <stdexcept>

EmbeddingTokensEncoder::EmbeddingTokensEncoder(Vocabulary words, size_t embedding_size,
                                               const PropertyRegistry& registry, bool lowercase,
                                               unsigned int seed)
    : words_(std::move(words)), lowercase_(lowercase) {
    if (embedding_size == 0) {
        throw std::invalid_argument("Word embedding size must be positive");
    }
    std::mt19937 gen(seed);
    embeddings_ = TokenEmbedding(words_.size(), embedding_size, gen);

    for (const auto& property : registry.properties()) {
        for (const auto& value : property.values) {
            feature_keys_.push_back(feature_key(property.name, value));
        }
    }
    rebuild_feature_index();
}

std::string EmbeddingTokensEncoder::feature_key(const std::string& property,
                                                const std::string& value) {
    return property + "=" + value;
}

void EmbeddingTokensEncoder::rebuild_feature_index() {
    feature_index_.clear();
    for (size_t i = 0; i < feature_keys_.size(); ++i) {
        feature_index_.emplace(feature_keys_[i], i);
    }
}

Matrix EmbeddingTokensEncoder::forward(const Sentence& sentence) {
    const auto& readings = sentence.analysis.readings;
    if (!readings.empty() && readings.size() != sentence.size()) {
        throw std::invalid_argument("Morphological analysis covers " +
                                    std::to_string(readings.size()) + " tokens of a sentence of " +
                                    std::to_string(sentence.size()));
    }

    std::vector<int> ids;
    ids.reserve(sentence.size());
    for (const auto& token : sentence.tokens) {
        ids.push_back(words_.get_id(lowercase_ ? Utils::to_lower(token.form) : token.form));
    }
    Matrix word_vectors = embeddings_.forward(ids);

    const size_t embedding_size = embeddings_.get_embedding_dim();
    Matrix output(sentence.size(), output_size());
    for (size_t i = 0; i < sentence.size(); ++i) {
        for (size_t j = 0; j < embedding_size; ++j) {
            output(i, j) = word_vectors(i, j);
        }
        if (readings.empty()) {
            continue;
        }
        for (const auto& reading : readings[i]) {
            for (const auto& [property, value] : reading.properties) {
                auto it = feature_index_.find(feature_key(property, value));
                if (it != feature_index_.end()) {
                    output(i, embedding_size + it->second) = 1.0f;
                }
            }
        }
    }
    return output;
}

void EmbeddingTokensEncoder::backward(const Matrix& grad_output) {
    const size_t embedding_size = embeddings_.get_embedding_dim();
    if (grad_output.cols() != output_size()) {
        throw std::runtime_error("Tokens encoder backward called with a gradient of the wrong "
                                 "shape");
    }

    Matrix grad_words(grad_output.rows(), embedding_size);
    for (size_t i = 0; i < grad_output.rows(); ++i) {
        for (size_t j = 0; j < embedding_size; ++j) {
            grad_words(i, j) = grad_output(i, j);
        }
    }
    embeddings_.backward(grad_words);
}
