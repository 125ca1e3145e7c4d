#pragma once
#include "context_encoder.hpp"
#include "grammatical_properties.hpp"
#include "property_classifier.hpp"
#include "sentence.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cereal/types/memory.hpp>
#include <cereal/types/polymorphic.hpp>
#include <cereal/types/vector.hpp>

/**
 * @brief Prediction of one property for one token.
 *
 * `value` is empty when the "no value" class wins.
 */
struct Prediction {
    std::string property;
    std::optional<std::string> value;
    Vector distribution;
};

/// Predictions of one token, keyed by property name
using TokenPredictions = std::map<std::string, Prediction>;

/// Output errors of one token (gradients w.r.t. the head logits), keyed by property name
using TokenErrors = std::map<std::string, Vector>;

/**
 * @brief The classification heads: one PropertyClassifier per registry
 * property, in registry order, all reading token encodings of the same size.
 */
class MorphoPredictorModel {
  public:
    MorphoPredictorModel() = default;

    /**
     * @param registry Properties to predict
     * @param token_encoding_size Size of the token encodings given to the heads
     * @param hidden_size Size of the heads' hidden layer, 0 for token_encoding_size
     * @param seed Seed of the weight initialization
     */
    MorphoPredictorModel(std::shared_ptr<const PropertyRegistry> registry,
                         size_t token_encoding_size, size_t hidden_size, unsigned int seed);

    const PropertyRegistry& registry() const {
        return *registry_;
    }

    std::shared_ptr<const PropertyRegistry> registry_ptr() const {
        return registry_;
    }

    size_t token_encoding_size() const {
        return token_encoding_size_;
    }

    std::vector<PropertyClassifier>& classifiers() {
        return classifiers_;
    }

    const std::vector<PropertyClassifier>& classifiers() const {
        return classifiers_;
    }

    ParameterList parameters();

    template <class Archive>
    void save(Archive& ar) const {
        ar(*registry_, token_encoding_size_, classifiers_);
    }

    template <class Archive>
    void load(Archive& ar) {
        PropertyRegistry registry;
        ar(registry, token_encoding_size_, classifiers_);
        registry_ = std::make_shared<const PropertyRegistry>(std::move(registry));
        validate();
    }

  private:
    std::shared_ptr<const PropertyRegistry> registry_;
    size_t token_encoding_size_ = 0;
    std::vector<PropertyClassifier> classifiers_;

    /**
     * @throws std::runtime_error if the heads do not match the registry
     */
    void validate() const;
};

/**
 * @brief A context encoder bundled with the heads that read its output.
 */
class TextMorphoPredictorModel {
  public:
    TextMorphoPredictorModel() = default;

    /**
     * @throws std::invalid_argument if a component is missing or the encoder
     *         output size differs from the heads' token encoding size
     */
    TextMorphoPredictorModel(std::shared_ptr<MorphoPredictorModel> predictor,
                             std::shared_ptr<ContextEncoder> encoder);

    MorphoPredictorModel& predictor() {
        return *predictor_;
    }

    const MorphoPredictorModel& predictor() const {
        return *predictor_;
    }

    std::shared_ptr<MorphoPredictorModel> predictor_ptr() const {
        return predictor_;
    }

    ContextEncoder& encoder() {
        return *encoder_;
    }

    const ContextEncoder& encoder() const {
        return *encoder_;
    }

    std::shared_ptr<ContextEncoder> encoder_ptr() const {
        return encoder_;
    }

    const PropertyRegistry& registry() const {
        return predictor_->registry();
    }

    /**
     * @brief Heads, plus the encoder when it is trainable.
     */
    ParameterList trainable_parameters();

    template <class Archive>
    void save(Archive& ar) const {
        ar(predictor_, encoder_);
    }

    template <class Archive>
    void load(Archive& ar) {
        std::shared_ptr<MorphoPredictorModel> predictor;
        std::shared_ptr<ContextEncoder> encoder;
        ar(predictor, encoder);
        *this = TextMorphoPredictorModel(std::move(predictor), std::move(encoder));
    }

  private:
    std::shared_ptr<MorphoPredictorModel> predictor_;
    std::shared_ptr<ContextEncoder> encoder_;
};

/**
 * @brief Runs the joint forward and backward computation of a
 * TextMorphoPredictorModel over one sentence at a time.
 */
class MorphoPredictor {
  public:
    explicit MorphoPredictor(TextMorphoPredictorModel& model);

    /**
     * @brief Predicts every property of every token.
     * @return One prediction map per token, in token order
     * @throws std::logic_error if the encoder does not return one row per token
     */
    std::vector<TokenPredictions> forward(const Sentence& sentence);

    /**
     * @brief Back-propagates the output errors of the last forward() call.
     *
     * Every head is backwarded on its own errors; when the encoder is
     * trainable the heads' input gradients are averaged and propagated
     * through it.
     *
     * @param errors One error map per token, with an entry for every property
     * @throws std::invalid_argument if the errors do not match the last forward()
     */
    void backward(const std::vector<TokenErrors>& errors);

    TextMorphoPredictorModel& model() {
        return model_;
    }

  private:
    TextMorphoPredictorModel& model_;
    size_t last_token_count_ = 0;
};
