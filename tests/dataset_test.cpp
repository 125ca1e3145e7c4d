#include "dataset.hpp"
#include "morphology.hpp"
#include <gtest/gtest.h>

namespace {

const std::string kDataDir = MORPHO_TEST_DATA_DIR;

Dataset load_sample(const MorphologicalAnalyzer& analyzer) {
    return Dataset::from_file(kDataDir + "/sample_dataset.jsonl",
                              PropertyRegistry::default_registry(), analyzer);
}

}  // namespace

TEST(DatasetTest, LoadsEveryNonBlankLine) {
    EmptyAnalyzer analyzer;
    Dataset dataset = load_sample(analyzer);
    ASSERT_EQ(dataset.size(), 2u);
    EXPECT_EQ(dataset.examples()[0].position.index, 0u);
    EXPECT_EQ(dataset.examples()[1].position.index, 1u);
}

TEST(DatasetTest, BestMorphologyGivesTheGoldValues) {
    EmptyAnalyzer analyzer;
    PropertyRegistry registry = PropertyRegistry::default_registry();
    Dataset dataset = load_sample(analyzer);
    const Token& run = dataset.examples()[0].tokens[1];

    EXPECT_EQ(run.form, "run");
    EXPECT_EQ(run.property("tense"), std::optional<std::string>("present"));
    EXPECT_EQ(run.property("number"), std::nullopt);

    EXPECT_EQ(registry.gold_index("tense", run.property("tense")),
              *registry.get("tense").index_of("present"));
    for (const auto& property : registry.properties()) {
        if (property.name != "tense" && property.name != "mood") {
            EXPECT_EQ(registry.gold_index(property.name, run.property(property.name)),
                      property.values.size())
                << property.name;
        }
    }
}

TEST(DatasetTest, PositionsCountCodePointsAndSeparators) {
    EmptyAnalyzer analyzer;
    Dataset dataset = load_sample(analyzer);
    const Sentence& first = dataset.examples()[0];
    EXPECT_EQ(first.tokens[0].position.start, 0u);
    EXPECT_EQ(first.tokens[0].position.end, 0u);
    EXPECT_EQ(first.tokens[1].position.start, 2u);
    EXPECT_EQ(first.tokens[1].position.end, 4u);
    EXPECT_EQ(first.position.end, 4u);
}

TEST(DatasetTest, ComponentsBecomeTokensNamedByLemma) {
    EmptyAnalyzer analyzer;
    Dataset dataset = load_sample(analyzer);
    const Sentence& second = dataset.examples()[1];

    ASSERT_EQ(second.size(), 3u);
    EXPECT_EQ(second.forms(), (std::vector<std::string>{"di", "il", "mare"}));
    EXPECT_EQ(second.tokens[0].position.index, 0u);
    EXPECT_EQ(second.tokens[1].position.index, 0u);
    EXPECT_EQ(second.tokens[2].position.index, 1u);
    EXPECT_EQ(second.tokens[1].position.start, 3u);
    EXPECT_EQ(second.tokens[2].position.start, 6u);
}

TEST(DatasetTest, UnknownPropertiesAndValuesAreDropped) {
    EmptyAnalyzer analyzer;
    Dataset dataset = load_sample(analyzer);
    const Token& il = dataset.examples()[1].tokens[1];
    EXPECT_EQ(il.properties.size(), 2u);
    EXPECT_EQ(il.property("gender"), std::optional<std::string>("masculine"));
    EXPECT_EQ(il.property("case"), std::nullopt);
    EXPECT_EQ(il.property("aspect"), std::nullopt);

    const Token& mare = dataset.examples()[1].tokens[2];
    EXPECT_EQ(mare.property("number"), std::nullopt);
}

TEST(DatasetTest, AmbiguousTokenWithoutBestIsInvalid) {
    EmptyAnalyzer analyzer;
    try {
        Dataset::from_file(kDataDir + "/ambiguous_dataset.jsonl",
                           PropertyRegistry::default_registry(), analyzer);
        FAIL() << "Expected InvalidExample";
    } catch (const InvalidExample& e) {
        EXPECT_EQ(e.line_index(), 1u);
        EXPECT_NE(std::string(e.what()).find("Example #1"), std::string::npos);
    }
}

TEST(DatasetTest, MalformedJsonIsInvalid) {
    EmptyAnalyzer analyzer;
    EXPECT_THROW(Dataset::from_file(kDataDir + "/malformed_dataset.jsonl",
                                    PropertyRegistry::default_registry(), analyzer),
                 InvalidExample);
}

TEST(DatasetTest, MissingFileThrows) {
    EmptyAnalyzer analyzer;
    EXPECT_THROW(Dataset::from_file(kDataDir + "/missing.jsonl",
                                    PropertyRegistry::default_registry(), analyzer),
                 std::runtime_error);
}

TEST(DatasetTest, SeparatorWidthShiftsPositions) {
    nlohmann::json example = nlohmann::json::parse(
        R"({"tokens": [{"form": "ab", "morphologies": [{"components": [{"lemma": "ab", "properties": {}}]}]},
                       {"form": "cd", "morphologies": [{"components": [{"lemma": "cd", "properties": {}}]}]}]})");
    DatasetOptions options;
    options.token_separator_width = 0;
    Sentence sentence =
        Dataset::parse_example(example, 4, PropertyRegistry::default_registry(), options);
    EXPECT_EQ(sentence.tokens[1].position.start, 3u);
    EXPECT_EQ(sentence.position.index, 4u);
}

TEST(DatasetTest, DictionaryAnalysisCoversEveryToken) {
    DictionaryAnalyzer analyzer = DictionaryAnalyzer::load(kDataDir + "/dictionary.jsonl");
    EXPECT_EQ(analyzer.size(), 2u);

    Dataset dataset = load_sample(analyzer);
    const Sentence& first = dataset.examples()[0];
    ASSERT_EQ(first.analysis.readings.size(), first.size());
    EXPECT_TRUE(first.analysis.readings[0].empty());
    EXPECT_EQ(first.analysis.readings[1].size(), 2u);
}

TEST(DatasetTest, SentenceFromTextSplitsPunctuation) {
    Sentence sentence = Dataset::sentence_from_text("Hi, you  there.", 3);
    EXPECT_EQ(sentence.forms(), (std::vector<std::string>{"Hi", ",", "you", "there", "."}));
    EXPECT_EQ(sentence.tokens[1].position.start, 2u);
    EXPECT_EQ(sentence.tokens[2].position.start, 4u);
    EXPECT_EQ(sentence.tokens[3].position.start, 9u);
    EXPECT_EQ(sentence.tokens[4].position.end, 14u);
    EXPECT_EQ(sentence.position.index, 3u);
}
