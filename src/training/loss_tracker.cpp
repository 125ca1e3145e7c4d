#include "../../include/training/loss_tracker.hpp"
#include <cmath>
#include <numeric>

void LossTracker::add_loss(float loss) {
    if (std::isfinite(loss)) {
        loss_history.push_back(loss);
        if (loss_history.size() > WINDOW_SIZE) {
            loss_history.pop_front();
        }
        loss_sum += loss;
        sample_count++;
        update_statistics();
    }
}

void LossTracker::reset() {
    loss_history.clear();
    loss_sum = 0.0;
    sample_count = 0;
    recent_average = 0.0f;
    overall_average = 0.0f;
}

void LossTracker::update_statistics() {
    if (loss_history.empty()) return;

    recent_average = std::accumulate(loss_history.begin(), loss_history.end(), 0.0f) /
                     static_cast<float>(loss_history.size());
    overall_average = static_cast<float>(loss_sum / sample_count);
}
