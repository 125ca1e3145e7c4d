#pragma once
#include "../grammatical_properties.hpp"
#include <string>
#include <utility>
#include <vector>

/**
 * @brief True positive, false positive and false negative counts of one
 * property, with the metrics derived from them.
 */
class MetricCounter {
  public:
    size_t true_pos = 0;
    size_t false_pos = 0;
    size_t false_neg = 0;

    /// tp / (tp + fp), 0 when nothing was predicted
    double precision() const;

    /// tp / (tp + fn), 0 when nothing was expected
    double recall() const;

    /**
     * @brief Harmonic mean of precision and recall.
     *
     * A counter that never saw a prediction or a gold value scores 1.0.
     */
    double f1_score() const;

    void reset();

    std::string to_string() const;
};

/**
 * @brief Evaluation results: one MetricCounter per property in registry
 * order, and the overall accuracy (mean F1 over all properties).
 */
class Statistics {
  public:
    Statistics() = default;
    explicit Statistics(const PropertyRegistry& registry);

    MetricCounter& metric(const std::string& property);
    const MetricCounter& metric(const std::string& property) const;

    const std::vector<std::pair<std::string, MetricCounter>>& metrics() const {
        return metrics_;
    }

    double accuracy() const {
        return accuracy_;
    }

    /**
     * @brief Sets the accuracy to the mean F1 score of all properties.
     */
    void update_accuracy();

    /**
     * @brief Zeros every counter and the accuracy.
     */
    void reset();

    /**
     * @brief Multi-line report:
     * - Overall accuracy: 87.50%
     * - Properties accuracy:
     *     `tense` : precision 90.00%, recall 85.00%, f1 score 87.43%
     */
    std::string to_string() const;

  private:
    std::vector<std::pair<std::string, MetricCounter>> metrics_;
    double accuracy_ = 0.0;
};
