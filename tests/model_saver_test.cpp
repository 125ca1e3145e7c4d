#include "model_factory.hpp"
#include "model_saver.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using test_helpers::make_sentence;

namespace {

class ModelSaverTest : public ::testing::Test {
  protected:
    void SetUp() override {
        directory = fs::temp_directory_path() / ("morpho_saver_test_" + std::to_string(::getpid()));
        fs::create_directories(directory);

        training_set = Dataset({make_sentence({"the", "dogs", "ran"}),
                                make_sentence({"a", "dog", "runs", "."})});
        config.properties = test_helpers::small_registry();
        config.transformer.hidden_size = 8;
        config.transformer.num_heads = 2;
        config.transformer.num_layers = 1;
        config.transformer.intermediate_size = 16;
        config.transformer.max_seq_length = 64;
        config.recurrent.word_embedding_size = 4;
        config.recurrent.hidden_size = 3;
    }

    void TearDown() override {
        fs::remove_all(directory);
    }

    std::string path(const std::string& name) const {
        return (directory / name).string();
    }

    static void expect_same_predictions(TextMorphoPredictorModel& a, TextMorphoPredictorModel& b,
                                        const Sentence& sentence) {
        MorphoPredictor predictor_a(a);
        MorphoPredictor predictor_b(b);
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

    fs::path directory;
    Dataset training_set;
    PredictorConfig config;
    ModelSaver saver;
};

}  // namespace

TEST_F(ModelSaverTest, TransformerModelRestoresPredictions) {
    auto model = build_text_model(config, build_context_encoder(config, training_set));
    ASSERT_TRUE(saver.save_text_model(*model, path("model.bin"), 3, 0.5));

    auto loaded = saver.load_text_model(path("model.bin"));
    EXPECT_EQ(loaded->registry(), model->registry());
    expect_same_predictions(*model, *loaded, make_sentence({"dogs", "run", "fast"}));

    CheckpointMetadata meta = saver.read_metadata(path("model.bin"));
    EXPECT_EQ(meta.kind, "text_predictor");
    EXPECT_EQ(meta.epoch, 3u);
    EXPECT_DOUBLE_EQ(meta.accuracy, 0.5);
    EXPECT_EQ(meta.properties, (std::vector<std::string>{"tense", "number"}));
}

TEST_F(ModelSaverTest, RecurrentModelRestoresPredictions) {
    config.encoder_type = "recurrent";
    auto model = build_text_model(config, build_context_encoder(config, training_set));
    ASSERT_TRUE(saver.save_text_model(*model, path("rnn.bin")));

    auto loaded = saver.load_text_model(path("rnn.bin"));
    expect_same_predictions(*model, *loaded, make_sentence({"the", "dog", "ran"}));
}

TEST_F(ModelSaverTest, PredictorAndEncoderSavedSeparately) {
    auto model = build_text_model(config, build_context_encoder(config, training_set));
    ASSERT_TRUE(saver.save_predictor(model->predictor(), path("heads.bin")));
    ASSERT_TRUE(saver.save_encoder(model->encoder_ptr(), path("sub/encoder.bin")));

    TextMorphoPredictorModel rebuilt(saver.load_predictor(path("heads.bin")),
                                     saver.load_encoder(path("sub/encoder.bin")));
    expect_same_predictions(*model, rebuilt, make_sentence({"a", "dog"}));
}

TEST_F(ModelSaverTest, WrongKindIsRejected) {
    auto model = build_text_model(config, build_context_encoder(config, training_set));
    ASSERT_TRUE(saver.save_predictor(model->predictor(), path("heads.bin")));
    EXPECT_THROW(saver.load_text_model(path("heads.bin")), std::runtime_error);
    EXPECT_THROW(saver.load_encoder(path("heads.bin")), std::runtime_error);
}

TEST_F(ModelSaverTest, MissingOrForeignFilesAreRejected) {
    EXPECT_THROW(saver.load_predictor(path("missing.bin")), std::runtime_error);

    std::ofstream(path("garbage.bin"), std::ios::binary) << "not a checkpoint at all";
    EXPECT_THROW(saver.load_predictor(path("garbage.bin")), std::runtime_error);
}
