#include "../include/property_classifier.hpp"
#include <stdexcept>

PropertyClassifier::PropertyClassifier(std::string property, size_t input_size,
                                       size_t hidden_size, size_t output_size, std::mt19937& gen)
    : property_(std::move(property)),
      params_{Parameter(input_size, hidden_size), Parameter(1, hidden_size),
              Parameter(hidden_size, output_size), Parameter(1, output_size)} {
    if (input_size == 0 || hidden_size == 0 || output_size < 2) {
        throw std::invalid_argument("Invalid classifier sizes for property '" + property_ + "'");
    }
    params_.hidden_weights.initialize_xavier(gen);
    params_.output_weights.initialize_xavier(gen);
}

Matrix PropertyClassifier::forward(const Matrix& input) {
    if (input.cols() != input_size()) {
        throw std::runtime_error("Classifier '" + property_ + "' expects encodings of size " +
                                 std::to_string(input_size()) + ", got " +
                                 std::to_string(input.cols()));
    }

    input_cache_ = input;
    hidden_cache_ = affine(input, params_.hidden_weights, params_.hidden_bias);
    hidden_cache_.apply_tanh();

    Matrix output = affine(hidden_cache_, params_.output_weights, params_.output_bias);
    output.apply_softmax();
    return output;
}

Matrix PropertyClassifier::backward(const Matrix& output_errors) {
    if (output_errors.rows() != hidden_cache_.rows() || output_errors.cols() != output_size()) {
        throw std::runtime_error("Classifier '" + property_ +
                                 "' backward called with errors of the wrong shape");
    }

    Matrix grad_hidden =
        affine_backward(output_errors, hidden_cache_, params_.output_weights, params_.output_bias);
    for (size_t i = 0; i < grad_hidden.size(); ++i) {
        const float h = hidden_cache_.data()[i];
        grad_hidden.data()[i] *= 1.0f - h * h;
    }

    return affine_backward(grad_hidden, input_cache_, params_.hidden_weights, params_.hidden_bias);
}
