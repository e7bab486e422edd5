/**
 * @file PerformanceProfiler.hpp
 * @brief Compile-time optional timing of real-time render calls.
 */

#ifndef PCMFLOW_PERFORMANCE_PROFILER_HPP
#define PCMFLOW_PERFORMANCE_PROFILER_HPP

#include <chrono>
#include <cstddef>

#ifndef PCMFLOW_ENABLE_PROFILING
#define PCMFLOW_ENABLE_PROFILING 0
#endif

namespace pcmflow {

/**
 * @brief Measures the duration of the last block, the worst block and the block count.
 *
 * With PCMFLOW_ENABLE_PROFILING unset every method is a no-op.
 */
class PerformanceProfiler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Nanoseconds = std::chrono::nanoseconds;

    PerformanceProfiler() = default;

#if PCMFLOW_ENABLE_PROFILING
    void start() {
        start_time_ = Clock::now();
    }

    void stop() {
        execution_time_ = std::chrono::duration_cast<Nanoseconds>(Clock::now() - start_time_);
        if (execution_time_ > max_execution_time_) {
            max_execution_time_ = execution_time_;
        }
        total_blocks_processed_++;
    }

    Nanoseconds elapsed() const { return execution_time_; }
    Nanoseconds max_execution_time() const { return max_execution_time_; }
    size_t total_blocks_processed() const { return total_blocks_processed_; }

    /**
     * @brief True if the last block took longer than @p buffer_budget.
     */
    bool exceeds_budget(Nanoseconds buffer_budget) const {
        return execution_time_ > buffer_budget;
    }

private:
    TimePoint start_time_;
    Nanoseconds execution_time_{0};
    Nanoseconds max_execution_time_{0};
    size_t total_blocks_processed_{0};

#else
    void start() {}
    void stop() {}
    Nanoseconds elapsed() const { return Nanoseconds::zero(); }
    Nanoseconds max_execution_time() const { return Nanoseconds::zero(); }
    size_t total_blocks_processed() const { return 0; }
    bool exceeds_budget(Nanoseconds) const { return false; }
#endif
};

} // namespace pcmflow

#endif // PCMFLOW_PERFORMANCE_PROFILER_HPP
