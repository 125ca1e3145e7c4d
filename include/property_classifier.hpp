#pragma once
#include "components.hpp"
#include <random>
#include <string>
#include <cereal/types/string.hpp>

/**
 * @brief Classification head of one grammatical property.
 *
 * p = softmax(tanh(x W1 + b1) W2 + b2), applied to every token row. The
 * output has one class per value of the property plus the "no value" class.
 */
class PropertyClassifier {
  private:
    struct Parameters {
        Parameter hidden_weights;
        Parameter hidden_bias;
        Parameter output_weights;
        Parameter output_bias;
    };

    std::string property_;
    Parameters params_;

    Matrix input_cache_;
    Matrix hidden_cache_;

  public:
    PropertyClassifier() = default;

    /**
     * @param property Name of the predicted property
     * @param input_size Size of the token encodings
     * @param hidden_size Size of the tanh layer
     * @param output_size Number of classes (values + 1)
     * @param gen Random generator used for initialization
     */
    PropertyClassifier(std::string property, size_t input_size, size_t hidden_size,
                       size_t output_size, std::mt19937& gen);

    /**
     * @param input Token encodings of shape [num_tokens, input_size]
     * @return One probability distribution per row, shape [num_tokens, output_size]
     */
    Matrix forward(const Matrix& input);

    /**
     * @brief Backward pass for the last forward() call.
     *
     * Accumulates the parameter gradients.
     *
     * @param output_errors Errors with respect to the softmax logits, one row
     *        per token (softmax cross-entropy gradient)
     * @return Gradient with respect to the input encodings
     */
    Matrix backward(const Matrix& output_errors);

    ParameterList parameters() {
        return {&params_.hidden_weights, &params_.hidden_bias, &params_.output_weights,
                &params_.output_bias};
    }

    const std::string& property() const {
        return property_;
    }

    size_t input_size() const {
        return params_.hidden_weights.value.rows();
    }

    size_t hidden_size() const {
        return params_.hidden_weights.value.cols();
    }

    size_t output_size() const {
        return params_.output_weights.value.cols();
    }

    template <class Archive>
    void serialize(Archive& ar) {
        ar(property_, params_.hidden_weights, params_.hidden_bias, params_.output_weights,
           params_.output_bias);
    }
};
