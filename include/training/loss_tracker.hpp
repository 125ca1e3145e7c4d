#pragma once
#include <cstddef>
#include <deque>

/**
 * @brief Running loss averages reported during training.
 *
 * Keeps a bounded window of the most recent losses for the progress log
 * and an unbounded mean of the whole epoch.
 */
class LossTracker {
public:
    static constexpr size_t WINDOW_SIZE = 100;

    /**
     * @brief Records one loss; non-finite values are ignored.
     */
    void add_loss(float loss);

    float get_recent_average() const { return recent_average; }
    float get_overall_average() const { return overall_average; }
    size_t get_sample_count() const { return sample_count; }

    void reset();

private:
    std::deque<float> loss_history;
    double loss_sum = 0.0;
    size_t sample_count = 0;
    float recent_average = 0.0f;
    float overall_average = 0.0f;

    void update_statistics();
};
