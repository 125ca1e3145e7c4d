#include "model_factory.hpp"
#include "model_saver.hpp"
#include "morphology.hpp"
#include "trainer.hpp"
#include <filesystem>
#include <unistd.h>
#include <gtest/gtest.h>

namespace fs = std::filesystem;

namespace {

const std::string kDataDir = MORPHO_TEST_DATA_DIR;

class TrainerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        directory =
            fs::temp_directory_path() / ("morpho_trainer_test_" + std::to_string(::getpid()));
        fs::create_directories(directory);

        EmptyAnalyzer analyzer;
        dataset = Dataset::from_file(kDataDir + "/sample_dataset.jsonl", config.properties,
                                     analyzer);
        config.encoder_type = "recurrent";
        config.recurrent.word_embedding_size = 4;
        config.recurrent.hidden_size = 3;
        config.predictor_hidden_size = 5;
        config.training.epochs = 1;
        config.training.learning_rate = 0.01f;
        config.training.log_every = 0;
    }

    void TearDown() override {
        fs::remove_all(directory);
    }

    std::string path(const std::string& name) const {
        return (directory / name).string();
    }

    std::shared_ptr<TextMorphoPredictorModel> build_model() const {
        return build_text_model(config, build_context_encoder(config, dataset));
    }

    static void expect_same_predictions(TextMorphoPredictorModel& a, TextMorphoPredictorModel& b,
                                        const Dataset& sentences) {
        MorphoPredictor predictor_a(a);
        MorphoPredictor predictor_b(b);
        for (const auto& sentence : sentences.examples()) {
            auto expected = predictor_a.forward(sentence);
            auto actual = predictor_b.forward(sentence);
            ASSERT_EQ(expected.size(), actual.size());
            for (size_t t = 0; t < expected.size(); ++t) {
                for (const auto& entry : expected[t]) {
                    const Prediction& other = actual[t].at(entry.first);
                    EXPECT_EQ(entry.second.value, other.value);
                    for (size_t i = 0; i < entry.second.distribution.size(); ++i) {
                        EXPECT_FLOAT_EQ(entry.second.distribution[i], other.distribution[i]);
                    }
                }
            }
        }
    }

    fs::path directory;
    PredictorConfig config;
    Dataset dataset;
    ModelSaver saver;
};

}  // namespace

TEST_F(TrainerTest, WholeModelCheckpointRestoresPredictions) {
    auto model = build_model();
    Evaluator evaluator(*model, dataset, false);
    MorphoPredictorTrainer trainer(*model, path("model.bin"), dataset, evaluator, config.training);
    trainer.train();

    ASSERT_TRUE(fs::exists(path("model.bin")));
    EXPECT_GE(trainer.get_best_accuracy(), 0.0);
    CheckpointMetadata meta = saver.read_metadata(path("model.bin"));
    EXPECT_EQ(meta.kind, "text_predictor");
    EXPECT_EQ(meta.epoch, 1u);

    auto loaded = saver.load_text_model(path("model.bin"));
    expect_same_predictions(*model, *loaded, dataset);
}

TEST_F(TrainerTest, PredictorCheckpointKeepsTheFineTunedEncoder) {
    config.training.save_whole_model = false;
    auto model = build_model();
    ASSERT_TRUE(model->encoder().trainable());

    Evaluator evaluator(*model, dataset, false);
    const std::string model_path = path("predictor.bin");
    MorphoPredictorTrainer trainer(*model, model_path, dataset, evaluator, config.training);
    trainer.train();

    ASSERT_TRUE(fs::exists(model_path));
    ASSERT_TRUE(fs::exists(MorphoPredictorTrainer::encoder_path(model_path)));
    EXPECT_EQ(saver.read_metadata(model_path).kind, "predictor");

    TextMorphoPredictorModel loaded(
        saver.load_predictor(model_path),
        saver.load_encoder(MorphoPredictorTrainer::encoder_path(model_path)));
    expect_same_predictions(*model, loaded, dataset);
}

TEST_F(TrainerTest, FrozenEncoderIsNotRewritten) {
    config.training.save_whole_model = false;
    auto model = build_model();
    model->encoder().set_trainable(false);

    Evaluator evaluator(*model, dataset, false);
    const std::string model_path = path("predictor.bin");
    MorphoPredictorTrainer trainer(*model, model_path, dataset, evaluator, config.training);
    trainer.train();

    EXPECT_TRUE(fs::exists(model_path));
    EXPECT_FALSE(fs::exists(MorphoPredictorTrainer::encoder_path(model_path)));
}

TEST_F(TrainerTest, SameSeedGivesSameLosses) {
    config.training.epochs = 2;

    auto first_model = build_model();
    Evaluator first_evaluator(*first_model, dataset, false);
    MorphoPredictorTrainer first(*first_model, path("first.bin"), dataset, first_evaluator,
                                 config.training);
    first.train();

    auto second_model = build_model();
    Evaluator second_evaluator(*second_model, dataset, false);
    MorphoPredictorTrainer second(*second_model, path("second.bin"), dataset, second_evaluator,
                                  config.training);
    second.train();

    const auto& expected = first.get_epoch_losses();
    const auto& actual = second.get_epoch_losses();
    ASSERT_EQ(expected.size(), 2u);
    ASSERT_EQ(actual.size(), 2u);
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_FLOAT_EQ(expected[i], actual[i]);
        EXPECT_GT(expected[i], 0.0f);
    }
    EXPECT_DOUBLE_EQ(first.get_best_accuracy(), second.get_best_accuracy());
}

TEST_F(TrainerTest, EmptyDatasetsAreRejected) {
    auto model = build_model();
    Dataset empty;

    Evaluator evaluator(*model, dataset, false);
    MorphoPredictorTrainer no_training(*model, path("a.bin"), empty, evaluator, config.training);
    EXPECT_THROW(no_training.train(), std::runtime_error);

    Evaluator empty_evaluator(*model, empty, false);
    MorphoPredictorTrainer no_validation(*model, path("b.bin"), dataset, empty_evaluator,
                                         config.training);
    EXPECT_THROW(no_validation.train(), std::runtime_error);
    EXPECT_FALSE(fs::exists(path("b.bin")));
}

TEST_F(TrainerTest, EvaluateCountsEverySentence) {
    auto model = build_model();
    Evaluator evaluator(*model, dataset, false);
    Statistics stats = evaluator.evaluate();

    Statistics expected(model->registry());
    MorphoPredictor predictor(*model);
    for (const auto& sentence : dataset.examples()) {
        Evaluator::count(sentence, predictor.forward(sentence), expected);
    }
    expected.update_accuracy();

    ASSERT_EQ(stats.metrics().size(), expected.metrics().size());
    for (size_t i = 0; i < stats.metrics().size(); ++i) {
        const MetricCounter& actual = stats.metrics()[i].second;
        const MetricCounter& reference = expected.metrics()[i].second;
        EXPECT_EQ(stats.metrics()[i].first, expected.metrics()[i].first);
        EXPECT_EQ(actual.true_pos, reference.true_pos);
        EXPECT_EQ(actual.false_pos, reference.false_pos);
        EXPECT_EQ(actual.false_neg, reference.false_neg);
    }
    EXPECT_DOUBLE_EQ(stats.accuracy(), expected.accuracy());
}
