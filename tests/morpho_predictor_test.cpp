#include "gradient_merger.hpp"
#include "morpho_predictor.hpp"
#include "optimizer.hpp"
#include "recurrent_encoder.hpp"
#include "test_helpers.hpp"
#include "training/loss.hpp"
#include <gtest/gtest.h>

using test_helpers::FixedEncoder;
using test_helpers::make_sentence;
using test_helpers::small_registry;

namespace {

std::shared_ptr<TextMorphoPredictorModel> fixed_model(std::shared_ptr<ContextEncoder> encoder) {
    auto registry = std::make_shared<const PropertyRegistry>(small_registry());
    auto predictor = std::make_shared<MorphoPredictorModel>(registry, encoder->output_size(), 0, 42);
    return std::make_shared<TextMorphoPredictorModel>(predictor, encoder);
}

}  // namespace

TEST(MorphoPredictorModelTest, OneHeadPerPropertyInRegistryOrder) {
    auto model = fixed_model(std::make_shared<FixedEncoder>(6));
    const auto& classifiers = model->predictor().classifiers();
    ASSERT_EQ(classifiers.size(), 2u);
    EXPECT_EQ(classifiers[0].property(), "tense");
    EXPECT_EQ(classifiers[0].output_size(), 4u);
    EXPECT_EQ(classifiers[1].property(), "number");
    EXPECT_EQ(classifiers[1].output_size(), 3u);
    EXPECT_EQ(classifiers[0].hidden_size(), 6u);
}

TEST(MorphoPredictorModelTest, RejectsEncodingSizeMismatch) {
    auto registry = std::make_shared<const PropertyRegistry>(small_registry());
    auto predictor = std::make_shared<MorphoPredictorModel>(registry, 8, 0, 1);
    EXPECT_THROW(TextMorphoPredictorModel(predictor, std::make_shared<FixedEncoder>(6)),
                 std::invalid_argument);
}

TEST(MorphoPredictorTest, PredictsEveryPropertyOfEveryToken) {
    auto model = fixed_model(std::make_shared<FixedEncoder>(6));
    MorphoPredictor predictor(*model);
    Sentence sentence = make_sentence({"the", "dogs", "ran"});

    std::vector<TokenPredictions> predictions = predictor.forward(sentence);
    ASSERT_EQ(predictions.size(), 3u);
    for (const auto& token_predictions : predictions) {
        ASSERT_EQ(token_predictions.size(), 2u);
        for (const auto& property : model->registry().properties()) {
            const Prediction& prediction = token_predictions.at(property.name);
            EXPECT_EQ(prediction.distribution.size(), property.output_size());
            EXPECT_NEAR(prediction.distribution.sum(), 1.0f, 1e-5f);
            size_t best = prediction.distribution.argmax();
            if (best == property.no_value_index()) {
                EXPECT_FALSE(prediction.value.has_value());
            } else {
                ASSERT_TRUE(prediction.value.has_value());
                EXPECT_EQ(*prediction.value, property.values[best]);
            }
        }
    }
}

TEST(MorphoPredictorTest, EmptySentenceHasNoPredictions) {
    auto model = fixed_model(std::make_shared<FixedEncoder>(4));
    MorphoPredictor predictor(*model);
    EXPECT_TRUE(predictor.forward(Sentence{}).empty());
}

TEST(MorphoPredictorTest, EncoderRowMismatchIsALogicError) {
    auto model = fixed_model(std::make_shared<FixedEncoder>(4, 5));
    MorphoPredictor predictor(*model);
    EXPECT_THROW(predictor.forward(make_sentence({"a", "b"})), std::logic_error);
}

TEST(MorphoPredictorTest, BackwardSendsMeanHeadGradientToEncoder) {
    auto encoder = std::make_shared<FixedEncoder>(5);
    auto model = fixed_model(encoder);
    MorphoPredictor predictor(*model);
    Sentence sentence = make_sentence({"dogs", "ran"}, {{{"number", "plural"}}, {{"tense", "past"}}});

    auto predictions = predictor.forward(sentence);
    SentenceLoss loss = compute_sentence_loss(model->registry(), sentence, predictions);
    predictor.backward(loss.errors);

    ASSERT_EQ(encoder->backward_calls, 1u);
    EXPECT_EQ(encoder->last_gradients.rows(), 2u);
    EXPECT_EQ(encoder->last_gradients.cols(), 5u);
    for (Parameter* param : model->predictor().parameters()) {
        EXPECT_GT(param->grad.squared_norm(), 0.0f);
    }
}

TEST(MorphoPredictorTest, FrozenEncoderReceivesNoGradient) {
    auto encoder = std::make_shared<FixedEncoder>(5);
    encoder->set_trainable(false);
    auto model = fixed_model(encoder);
    MorphoPredictor predictor(*model);
    Sentence sentence = make_sentence({"dogs"}, {{{"number", "plural"}}});

    auto predictions = predictor.forward(sentence);
    predictor.backward(compute_sentence_loss(model->registry(), sentence, predictions).errors);
    EXPECT_EQ(encoder->backward_calls, 0u);
    EXPECT_EQ(model->trainable_parameters().size(), model->predictor().parameters().size());
}

TEST(MorphoPredictorTest, BackwardValidatesErrors) {
    auto model = fixed_model(std::make_shared<FixedEncoder>(4));
    MorphoPredictor predictor(*model);
    predictor.forward(make_sentence({"a", "b"}));

    EXPECT_THROW(predictor.backward(std::vector<TokenErrors>(1)), std::invalid_argument);
    EXPECT_THROW(predictor.backward(std::vector<TokenErrors>(2)), std::invalid_argument);
}

TEST(MorphoPredictorTest, GoldTargetsOfTheLoss) {
    auto model = fixed_model(std::make_shared<FixedEncoder>(4));
    MorphoPredictor predictor(*model);
    Sentence sentence = make_sentence({"run"}, {{{"tense", "present"}}});

    auto predictions = predictor.forward(sentence);
    SentenceLoss loss = compute_sentence_loss(model->registry(), sentence, predictions);

    // tense targets "present" (index 0), number targets its "no value" slot (index 2)
    const Vector& tense_dist = predictions[0].at("tense").distribution;
    const Vector& tense_errors = loss.errors[0].at("tense");
    EXPECT_FLOAT_EQ(tense_errors[0], tense_dist[0] - 1.0f);
    const Vector& number_dist = predictions[0].at("number").distribution;
    const Vector& number_errors = loss.errors[0].at("number");
    EXPECT_FLOAT_EQ(number_errors[2], number_dist[2] - 1.0f);
    EXPECT_FLOAT_EQ(number_errors[0], number_dist[0]);
}

TEST(MorphoPredictorTest, RecurrentModelLearnsATinyTask) {
    PropertyRegistry registry = small_registry();
    Vocabulary words = Vocabulary::build_word_vocabulary({"dog", "dogs", "runs", "ran"}, 1);
    EmbeddingTokensEncoder tokens_encoder(words, 6, registry, true, 3);
    auto encoder = std::make_shared<RecurrentContextEncoder>(std::move(tokens_encoder), 5, 3);
    auto predictor_model = std::make_shared<MorphoPredictorModel>(
        std::make_shared<const PropertyRegistry>(registry), encoder->output_size(), 8, 3);
    TextMorphoPredictorModel model(predictor_model, encoder);

    std::vector<Sentence> examples = {
        make_sentence({"dog", "runs"}, {{{"number", "singular"}},
                                        {{"number", "singular"}, {"tense", "present"}}}),
        make_sentence({"dogs", "ran"}, {{{"number", "plural"}}, {{"tense", "past"}}}),
    };

    MorphoPredictor predictor(model);
    Optimizer optimizer(0.01f, 0.9f, 0.999f, 1e-8f, false);
    optimizer.add_parameters(model.trainable_parameters());

    auto epoch_loss = [&](bool learn) {
        float total = 0.0f;
        for (const auto& sentence : examples) {
            auto predictions = predictor.forward(sentence);
            SentenceLoss loss = compute_sentence_loss(registry, sentence, predictions);
            total += loss.loss;
            if (learn) {
                predictor.backward(loss.errors);
                optimizer.step();
            }
        }
        return total;
    };

    float initial = epoch_loss(false);
    for (int epoch = 0; epoch < 50; ++epoch) {
        epoch_loss(true);
    }
    EXPECT_LT(epoch_loss(false), 0.5f * initial);

    auto predictions = predictor.forward(examples[1]);
    EXPECT_EQ(predictions[0].at("number").value, std::optional<std::string>("plural"));
    EXPECT_EQ(predictions[1].at("tense").value, std::optional<std::string>("past"));
}
