#include "../../include/training/loss.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

Vector softmax_cross_entropy_errors(const Vector& distribution, size_t gold_index) {
    Vector errors(distribution);
    errors.at(gold_index) -= 1.0f;
    return errors;
}

float cross_entropy_loss(const Vector& distribution, size_t gold_index) {
    constexpr float min_probability = 1e-12f;
    return -std::log(std::max(distribution.at(gold_index), min_probability));
}

SentenceLoss compute_sentence_loss(const PropertyRegistry& registry, const Sentence& sentence,
                                   const std::vector<TokenPredictions>& predictions) {
    if (predictions.size() != sentence.size()) {
        throw std::invalid_argument("Got " + std::to_string(predictions.size()) +
                                    " predictions for " + std::to_string(sentence.size()) +
                                    " tokens");
    }

    SentenceLoss result;
    result.errors.resize(sentence.size());

    for (size_t t = 0; t < sentence.size(); ++t) {
        const auto& token = sentence.tokens[t];
        for (const auto& property : registry.properties()) {
            const auto& prediction = predictions[t].at(property.name);
            const size_t gold = registry.gold_index(property.name, token.property(property.name));

            result.loss += cross_entropy_loss(prediction.distribution, gold);
            result.errors[t].emplace(property.name,
                                     softmax_cross_entropy_errors(prediction.distribution, gold));
        }
    }
    return result;
}
