#include "../include/evaluator.hpp"
#include "../include/logger.hpp"
#include "../include/performance_metrics.hpp"
#include <stdexcept>

Evaluator::Evaluator(TextMorphoPredictorModel& model, const Dataset& dataset, bool verbose)
    : model_(model), dataset_(dataset), verbose_(verbose) {}

void Evaluator::count(const Sentence& sentence, const std::vector<TokenPredictions>& predictions,
                      Statistics& stats) {
    if (predictions.size() != sentence.size()) {
        throw std::invalid_argument("Expected " + std::to_string(sentence.size()) +
                                    " prediction maps, got " + std::to_string(predictions.size()));
    }

    for (size_t i = 0; i < sentence.size(); ++i) {
        const Token& token = sentence.tokens[i];
        for (const auto& entry : predictions[i]) {
            MetricCounter& counter = stats.metric(entry.first);
            const std::optional<std::string>& predicted = entry.second.value;
            std::optional<std::string> gold = token.property(entry.first);

            if (predicted && gold && *predicted == *gold) {
                counter.true_pos++;
                continue;
            }
            if (predicted) {
                counter.false_pos++;
            }
            if (gold) {
                counter.false_neg++;
            }
        }
    }
}

Statistics Evaluator::evaluate() {
    Logger& logger = Logger::getInstance();
    PerformanceMetrics metrics;
    metrics.start_timer("evaluation");

    Statistics stats(model_.registry());
    MorphoPredictor predictor(model_);

    for (const Sentence& sentence : dataset_.examples()) {
        count(sentence, predictor.forward(sentence), stats);
    }
    stats.update_accuracy();

    double elapsed = metrics.stop_timer("evaluation");
    if (verbose_) {
        logger.log("Evaluated " + std::to_string(dataset_.size()) + " sentences in " +
                   PerformanceMetrics::format_duration(elapsed));
    }
    return stats;
}
