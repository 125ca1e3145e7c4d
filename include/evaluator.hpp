#pragma once
#include "dataset.hpp"
#include "morpho_predictor.hpp"
#include "training/statistics.hpp"
#include <vector>

/**
 * @brief Measures the predictions of a model against a validation dataset.
 */
class Evaluator {
  public:
    /**
     * @param model Model to evaluate, used in inference only
     * @param dataset Validation examples with gold annotations
     * @param verbose Whether to log progress and elapsed time
     */
    Evaluator(TextMorphoPredictorModel& model, const Dataset& dataset, bool verbose = true);

    /**
     * @brief Predicts every validation sentence and counts the results.
     * @return Per-property metrics and the overall accuracy
     */
    Statistics evaluate();

    size_t dataset_size() const {
        return dataset_.size();
    }

    /**
     * @brief Adds the outcome of one sentence to the counters.
     *
     * For every token and property: a non-empty prediction equal to the gold
     * value is a true positive; a non-empty prediction that differs is a
     * false positive; a non-empty gold value not predicted is a false negative.
     *
     * @throws std::invalid_argument if there is not one prediction map per token
     */
    static void count(const Sentence& sentence, const std::vector<TokenPredictions>& predictions,
                      Statistics& stats);

  private:
    TextMorphoPredictorModel& model_;
    const Dataset& dataset_;
    bool verbose_;
};
