#include "../../include/training/statistics.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

double MetricCounter::precision() const {
    size_t predicted = true_pos + false_pos;
    return predicted == 0 ? 0.0 : static_cast<double>(true_pos) / predicted;
}

double MetricCounter::recall() const {
    size_t expected = true_pos + false_neg;
    return expected == 0 ? 0.0 : static_cast<double>(true_pos) / expected;
}

double MetricCounter::f1_score() const {
    if (true_pos + false_pos + false_neg == 0) {
        return 1.0;
    }
    double p = precision();
    double r = recall();
    if (p + r == 0.0) {
        return 0.0;
    }
    return 2.0 * p * r / (p + r);
}

void MetricCounter::reset() {
    true_pos = 0;
    false_pos = 0;
    false_neg = 0;
}

std::string MetricCounter::to_string() const {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), "precision %.2f%%, recall %.2f%%, f1 score %.2f%%",
                  100.0 * precision(), 100.0 * recall(), 100.0 * f1_score());
    return buffer;
}

Statistics::Statistics(const PropertyRegistry& registry) {
    for (const auto& property : registry.properties()) {
        metrics_.emplace_back(property.name, MetricCounter{});
    }
}

MetricCounter& Statistics::metric(const std::string& property) {
    for (auto& entry : metrics_) {
        if (entry.first == property) {
            return entry.second;
        }
    }
    throw std::out_of_range("No statistics for property: " + property);
}

const MetricCounter& Statistics::metric(const std::string& property) const {
    for (const auto& entry : metrics_) {
        if (entry.first == property) {
            return entry.second;
        }
    }
    throw std::out_of_range("No statistics for property: " + property);
}

void Statistics::update_accuracy() {
    if (metrics_.empty()) {
        accuracy_ = 0.0;
        return;
    }
    double sum = 0.0;
    for (const auto& entry : metrics_) {
        sum += entry.second.f1_score();
    }
    accuracy_ = sum / metrics_.size();
}

void Statistics::reset() {
    for (auto& entry : metrics_) {
        entry.second.reset();
    }
    accuracy_ = 0.0;
}

std::string Statistics::to_string() const {
    size_t name_width = 0;
    for (const auto& entry : metrics_) {
        name_width = std::max(name_width, entry.first.size() + 2);
    }

    std::ostringstream oss;
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f%%", 100.0 * accuracy_);
    oss << "- Overall accuracy: " << buffer << "\n";
    oss << "- Properties accuracy:";
    for (const auto& entry : metrics_) {
        std::string quoted = "`" + entry.first + "`";
        oss << "\n    " << std::string(name_width - quoted.size(), ' ') << quoted << " : "
            << entry.second.to_string();
    }
    return oss.str();
}
