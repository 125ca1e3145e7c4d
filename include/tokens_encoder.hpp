#pragma once
#include "components.hpp"
#include "embeddings.hpp"
#include "grammatical_properties.hpp"
#include "sentence.hpp"
#include "vocabulary.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

/**
 * @brief Encodes each token independently of its context.
 *
 * The encoding of a token is its word embedding followed by a binary
 * feature vector with one slot per (property, value) pair of the registry;
 * a slot is set when some reading of the morphological analysis of the token
 * carries that pair. Word embeddings are trainable, the features are not.
 */
class EmbeddingTokensEncoder {
  public:
    EmbeddingTokensEncoder() = default;

    /**
     * @param words Word vocabulary; unknown forms map to [UNK]
     * @param embedding_size Size of the word embeddings
     * @param registry Source of the morphological feature slots
     * @param lowercase Whether forms are lowercased before lookup
     * @param seed Seed of the embedding initialization
     */
    EmbeddingTokensEncoder(Vocabulary words, size_t embedding_size,
                           const PropertyRegistry& registry, bool lowercase, unsigned int seed);

    /**
     * @return Matrix of shape [sentence.size(), output_size()]
     * @throws std::invalid_argument if the analysis does not cover every token
     */
    Matrix forward(const Sentence& sentence);

    /**
     * @brief Accumulates the word embedding gradients of the last forward().
     */
    void backward(const Matrix& grad_output);

    size_t output_size() const {
        return embeddings_.get_embedding_dim() + feature_keys_.size();
    }

    size_t feature_size() const {
        return feature_keys_.size();
    }

    ParameterList parameters() {
        return embeddings_.parameters();
    }

    const Vocabulary& vocabulary() const {
        return words_;
    }

    template <class Archive>
    void save(Archive& ar) const {
        ar(words_, embeddings_, feature_keys_, lowercase_);
    }

    template <class Archive>
    void load(Archive& ar) {
        ar(words_, embeddings_, feature_keys_, lowercase_);
        rebuild_feature_index();
    }

  private:
    Vocabulary words_;
    TokenEmbedding embeddings_;
    std::vector<std::string> feature_keys_;  ///< "property=value", in registry order
    std::unordered_map<std::string, size_t> feature_index_;
    bool lowercase_ = true;

    void rebuild_feature_index();
    static std::string feature_key(const std::string& property, const std::string& value);
};
