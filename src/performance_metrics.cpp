#include "../include/performance_metrics.hpp"
#include <cstdio>
#include <stdexcept>

void PerformanceMetrics::start_timer(const std::string& name) {
    start_times[name] = std::chrono::steady_clock::now();
}

double PerformanceMetrics::stop_timer(const std::string& name) {
    auto stop_time = std::chrono::steady_clock::now();
    auto it = start_times.find(name);
    if (it == start_times.end()) {
        throw std::runtime_error("Timer '" + name + "' was stopped without being started");
    }

    double duration =
        std::chrono::duration_cast<std::chrono::microseconds>(stop_time - it->second).count() /
        1000.0; // Convert to milliseconds
    start_times.erase(it);

    accumulated_times[name] += duration;
    call_counts[name]++;
    return duration;
}

double PerformanceMetrics::get_average_time(const std::string& name) const {
    auto count = get_call_count(name);
    if (count == 0) {
        return 0.0;
    }
    return accumulated_times.at(name) / static_cast<double>(count);
}

double PerformanceMetrics::get_total_time(const std::string& name) const {
    auto it = accumulated_times.find(name);
    return it == accumulated_times.end() ? 0.0 : it->second;
}

size_t PerformanceMetrics::get_call_count(const std::string& name) const {
    auto it = call_counts.find(name);
    return it == call_counts.end() ? 0 : it->second;
}

std::string PerformanceMetrics::format_duration(double milliseconds) {
    if (milliseconds < 0.0) {
        milliseconds = 0.0;
    }
    auto total_ms = static_cast<long long>(milliseconds + 0.5);
    long long hours = total_ms / 3600000;
    long long minutes = (total_ms / 60000) % 60;
    double seconds = static_cast<double>(total_ms % 60000) / 1000.0;

    char buffer[64];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%lldh %02lldm %06.3fs", hours, minutes, seconds);
    } else if (minutes > 0) {
        std::snprintf(buffer, sizeof(buffer), "%lldm %06.3fs", minutes, seconds);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.3fs", seconds);
    }
    return buffer;
}

void PerformanceMetrics::reset() {
    start_times.clear();
    accumulated_times.clear();
    call_counts.clear();
}
