#pragma once
#include "../grammatical_properties.hpp"
#include "../morpho_predictor.hpp"
#include "../sentence.hpp"
#include <vector>

/**
 * @brief Output errors and loss of one sentence.
 */
struct SentenceLoss {
    std::vector<TokenErrors> errors;  ///< Per token, per property
    float loss = 0.0f;                ///< Sum of the cross-entropy of every head on every token
};

/**
 * @brief Gradient of softmax cross-entropy with respect to the logits:
 * the distribution minus the one-hot gold vector.
 * @throws std::out_of_range if gold_index is outside the distribution
 */
Vector softmax_cross_entropy_errors(const Vector& distribution, size_t gold_index);

/**
 * @brief -log p[gold], with p clamped away from zero.
 */
float cross_entropy_loss(const Vector& distribution, size_t gold_index);

/**
 * @brief Compares the predictions of a sentence with its gold annotations.
 *
 * The target of each head is registry.gold_index(property, gold value), so a
 * token without a (known) gold value targets the "no value" class.
 *
 * @throws std::invalid_argument if there is not one prediction map per token
 */
SentenceLoss compute_sentence_loss(const PropertyRegistry& registry, const Sentence& sentence,
                                   const std::vector<TokenPredictions>& predictions);
