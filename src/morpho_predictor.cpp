#include "../include/morpho_predictor.hpp"
#include "../include/gradient_merger.hpp"
#include <random>
#include <stdexcept>

MorphoPredictorModel::MorphoPredictorModel(std::shared_ptr<const PropertyRegistry> registry,
                                           size_t token_encoding_size, size_t hidden_size,
                                           unsigned int seed)
    : registry_(std::move(registry)), token_encoding_size_(token_encoding_size) {
    if (!registry_) {
        throw std::invalid_argument("MorphoPredictorModel needs a property registry");
    }
    if (token_encoding_size_ == 0) {
        throw std::invalid_argument("Token encoding size must be positive");
    }

    const size_t heads_hidden_size = hidden_size == 0 ? token_encoding_size_ : hidden_size;
    std::mt19937 gen(seed);
    classifiers_.reserve(registry_->size());
    for (const auto& property : registry_->properties()) {
        classifiers_.emplace_back(property.name, token_encoding_size_, heads_hidden_size,
                                  property.output_size(), gen);
    }
}

void MorphoPredictorModel::validate() const {
    if (classifiers_.size() != registry_->size()) {
        throw std::runtime_error("Model has " + std::to_string(classifiers_.size()) +
                                 " classifiers for " + std::to_string(registry_->size()) +
                                 " properties");
    }
    for (size_t i = 0; i < classifiers_.size(); ++i) {
        const auto& property = registry_->properties()[i];
        const auto& classifier = classifiers_[i];
        if (classifier.property() != property.name ||
            classifier.output_size() != property.output_size() ||
            classifier.input_size() != token_encoding_size_) {
            throw std::runtime_error("Classifier #" + std::to_string(i) +
                                     " does not match property '" + property.name + "'");
        }
    }
}

ParameterList MorphoPredictorModel::parameters() {
    ParameterList params;
    for (auto& classifier : classifiers_) {
        append_parameters(params, classifier.parameters());
    }
    return params;
}

TextMorphoPredictorModel::TextMorphoPredictorModel(std::shared_ptr<MorphoPredictorModel> predictor,
                                                   std::shared_ptr<ContextEncoder> encoder)
    : predictor_(std::move(predictor)), encoder_(std::move(encoder)) {
    if (!predictor_ || !encoder_) {
        throw std::invalid_argument("TextMorphoPredictorModel needs a predictor and an encoder");
    }
    if (predictor_->token_encoding_size() != encoder_->output_size()) {
        throw std::invalid_argument(
            "Token encoding size mismatch: the predictor expects " +
            std::to_string(predictor_->token_encoding_size()) + " but the encoder produces " +
            std::to_string(encoder_->output_size()));
    }
}

ParameterList TextMorphoPredictorModel::trainable_parameters() {
    ParameterList params = predictor_->parameters();
    if (encoder_->trainable()) {
        append_parameters(params, encoder_->parameters());
    }
    return params;
}

MorphoPredictor::MorphoPredictor(TextMorphoPredictorModel& model) : model_(model) {}

std::vector<TokenPredictions> MorphoPredictor::forward(const Sentence& sentence) {
    last_token_count_ = sentence.size();
    if (sentence.empty()) {
        return {};
    }

    Matrix encodings = model_.encoder().forward(sentence);
    if (encodings.rows() != sentence.size()) {
        throw std::logic_error("Encoder returned " + std::to_string(encodings.rows()) +
                               " encodings for " + std::to_string(sentence.size()) + " tokens");
    }

    const auto& registry = model_.registry();
    std::vector<TokenPredictions> predictions(sentence.size());
    for (auto& classifier : model_.predictor().classifiers()) {
        Matrix distributions = classifier.forward(encodings);
        for (size_t t = 0; t < sentence.size(); ++t) {
            Vector distribution = distributions.row(t);
            Prediction prediction;
            prediction.property = classifier.property();
            prediction.value = registry.value_at(classifier.property(), distribution.argmax());
            prediction.distribution = std::move(distribution);
            predictions[t].emplace(classifier.property(), std::move(prediction));
        }
    }
    return predictions;
}

void MorphoPredictor::backward(const std::vector<TokenErrors>& errors) {
    if (errors.size() != last_token_count_) {
        throw std::invalid_argument("Got output errors for " + std::to_string(errors.size()) +
                                    " tokens, the last forward had " +
                                    std::to_string(last_token_count_));
    }
    if (errors.empty()) {
        return;
    }

    std::vector<Matrix> head_gradients;
    head_gradients.reserve(model_.predictor().classifiers().size());

    for (auto& classifier : model_.predictor().classifiers()) {
        Matrix output_errors(errors.size(), classifier.output_size());
        for (size_t t = 0; t < errors.size(); ++t) {
            auto it = errors[t].find(classifier.property());
            if (it == errors[t].end()) {
                throw std::invalid_argument("Missing output errors of property '" +
                                            classifier.property() + "' for token " +
                                            std::to_string(t));
            }
            output_errors.set_row(t, it->second);
        }
        head_gradients.push_back(classifier.backward(output_errors));
    }

    if (model_.encoder().trainable()) {
        model_.encoder().backward(merge_head_gradients(head_gradients));
    }
}
