#include "evaluator.hpp"
#include "test_helpers.hpp"
#include "training/statistics.hpp"
#include <gtest/gtest.h>

using test_helpers::make_sentence;
using test_helpers::small_registry;

namespace {

TokenPredictions predict(const std::optional<std::string>& tense,
                         const std::optional<std::string>& number) {
    TokenPredictions predictions;
    predictions["tense"] = Prediction{"tense", tense, Vector(4)};
    predictions["number"] = Prediction{"number", number, Vector(3)};
    return predictions;
}

}  // namespace

TEST(MetricCounterTest, UntouchedCounterScoresOne) {
    MetricCounter counter;
    EXPECT_DOUBLE_EQ(counter.f1_score(), 1.0);
}

TEST(MetricCounterTest, PrecisionRecallAndF1) {
    MetricCounter counter;
    counter.true_pos = 3;
    counter.false_pos = 1;
    counter.false_neg = 2;
    EXPECT_DOUBLE_EQ(counter.precision(), 0.75);
    EXPECT_DOUBLE_EQ(counter.recall(), 0.6);
    EXPECT_NEAR(counter.f1_score(), 2 * 0.75 * 0.6 / 1.35, 1e-12);
    EXPECT_EQ(counter.to_string(), "precision 75.00%, recall 60.00%, f1 score 66.67%");

    counter.reset();
    EXPECT_EQ(counter.true_pos + counter.false_pos + counter.false_neg, 0u);
}

TEST(StatisticsTest, AllCorrectScoresOne) {
    Statistics stats(small_registry());
    Sentence sentence = make_sentence({"dogs", "ran"}, {{{"number", "plural"}}, {{"tense", "past"}}});
    Evaluator::count(sentence, {predict(std::nullopt, std::string("plural")),
                                predict(std::string("past"), std::nullopt)},
                     stats);
    stats.update_accuracy();

    EXPECT_EQ(stats.metric("number").true_pos, 1u);
    EXPECT_EQ(stats.metric("tense").true_pos, 1u);
    EXPECT_DOUBLE_EQ(stats.accuracy(), 1.0);
}

TEST(StatisticsTest, AllWrongScoresZero) {
    Statistics stats(small_registry());
    Sentence sentence = make_sentence({"dogs", "ran"}, {{{"number", "plural"}}, {{"tense", "past"}}});
    Evaluator::count(sentence, {predict(std::string("future"), std::string("singular")),
                                predict(std::string("present"), std::string("singular"))},
                     stats);
    stats.update_accuracy();

    const MetricCounter& number = stats.metric("number");
    EXPECT_EQ(number.true_pos, 0u);
    EXPECT_EQ(number.false_pos, 2u);
    EXPECT_EQ(number.false_neg, 1u);
    EXPECT_DOUBLE_EQ(stats.accuracy(), 0.0);
}

TEST(StatisticsTest, MissedValueIsAFalseNegative) {
    Statistics stats(small_registry());
    Sentence sentence = make_sentence({"ran"}, {{{"tense", "past"}}});
    Evaluator::count(sentence, {predict(std::nullopt, std::nullopt)}, stats);
    stats.update_accuracy();

    EXPECT_EQ(stats.metric("tense").false_neg, 1u);
    EXPECT_DOUBLE_EQ(stats.metric("tense").f1_score(), 0.0);
    EXPECT_DOUBLE_EQ(stats.metric("number").f1_score(), 1.0);
    EXPECT_DOUBLE_EQ(stats.accuracy(), 0.5);
}

TEST(StatisticsTest, CountRejectsMismatchedPredictions) {
    Statistics stats(small_registry());
    EXPECT_THROW(Evaluator::count(make_sentence({"a", "b"}), {predict(std::nullopt, std::nullopt)},
                                  stats),
                 std::invalid_argument);
}

TEST(StatisticsTest, ReportLayout) {
    Statistics stats(small_registry());
    stats.metric("tense").true_pos = 1;
    stats.update_accuracy();
    std::string report = stats.to_string();

    EXPECT_EQ(report.rfind("- Overall accuracy: 100.00%\n- Properties accuracy:", 0), 0u);
    EXPECT_NE(report.find("\n     `tense` : precision 100.00%"), std::string::npos);
    EXPECT_NE(report.find("\n    `number` : precision 0.00%"), std::string::npos);
}
