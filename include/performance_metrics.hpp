#pragma once
#include <chrono>
#include <string>
#include <unordered_map>

/**
 * @brief Wall-clock timing of named operations.
 *
 * Used by the trainer, the evaluator and the command line tools to report
 * elapsed times. Timers are identified by name; each start/stop pair adds
 * one sample to the named operation.
 */
class PerformanceMetrics {
  private:
    /// Stores start times for active timing operations
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> start_times;

    /// Accumulates total time spent in each operation (milliseconds)
    std::unordered_map<std::string, double> accumulated_times;

    /// Tracks number of completed measurements of each operation
    std::unordered_map<std::string, size_t> call_counts;

  public:
    /**
     * @brief Starts timing an operation.
     * @param name Identifier for the operation being timed
     */
    void start_timer(const std::string& name);

    /**
     * @brief Stops timing an operation.
     *
     * @param name Identifier for the operation being timed
     * @return Elapsed time of this measurement in milliseconds
     * @throws std::runtime_error if no matching start_timer call exists
     */
    double stop_timer(const std::string& name);

    /**
     * @brief Average duration of the named operation in milliseconds.
     */
    double get_average_time(const std::string& name) const;

    /**
     * @brief Total duration of the named operation in milliseconds.
     */
    double get_total_time(const std::string& name) const;

    size_t get_call_count(const std::string& name) const;

    /**
     * @brief Formats a duration as "1h 02m 03.456s", omitting leading zero units.
     */
    static std::string format_duration(double milliseconds);

    void reset();
};
