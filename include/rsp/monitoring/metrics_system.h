#pragma once

/**
 * @file metrics_system.h
 * @brief Timing and counter instrumentation for the provisioning engine
 *
 * The orchestrator and entities report phase and operation durations
 * through an injected MetricsCollector. Reporting, plotting and load
 * tools consume the collected values; none of them live in this library.
 */

#include "rsp/config.h"
#include "rsp/result.h"
#include <memory>
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <atomic>

namespace rsp {
namespace monitoring {

/**
 * @brief Aggregated duration samples for one operation name
 */
struct DurationStats {
    uint64_t count = 0;
    double total_seconds = 0.0;
    double min_seconds = 0.0;
    double max_seconds = 0.0;
    double last_seconds = 0.0;

    double mean_seconds() const {
        return count == 0 ? 0.0 : total_seconds / static_cast<double>(count);
    }
};

/**
 * @brief Snapshot of everything a collector holds
 */
struct MetricsSnapshot {
    std::unordered_map<std::string, DurationStats> durations;
    std::unordered_map<std::string, uint64_t> counters;
};

/**
 * @brief Metrics collector interface
 */
class RSP_API MetricsCollector {
public:
    virtual ~MetricsCollector() = default;

    /**
     * @brief Record the elapsed time of a named operation
     */
    virtual void record_duration(const std::string& name, double seconds) = 0;

    /**
     * @brief Record counter metric
     */
    virtual void record_counter(const std::string& name, uint64_t value = 1) = 0;

    virtual MetricsSnapshot get_metrics() const = 0;

    virtual void reset_metrics() = 0;
};

/**
 * @brief Thread-safe collector keeping count/sum/min/max per name
 */
class RSP_API InMemoryMetricsCollector : public MetricsCollector {
public:
    void record_duration(const std::string& name, double seconds) override;
    void record_counter(const std::string& name, uint64_t value = 1) override;
    MetricsSnapshot get_metrics() const override;
    void reset_metrics() override;

    /**
     * @brief Names in first-recorded order, for stable report output
     */
    std::vector<std::string> recorded_names() const;

private:
    mutable std::mutex metrics_mutex_;
    std::unordered_map<std::string, DurationStats> durations_;
    std::unordered_map<std::string, uint64_t> counters_;
    std::vector<std::string> order_;
};

/**
 * @brief Collector that discards everything
 */
class RSP_API NullMetricsCollector : public MetricsCollector {
public:
    void record_duration(const std::string&, double) override {}
    void record_counter(const std::string&, uint64_t = 1) override {}
    MetricsSnapshot get_metrics() const override { return {}; }
    void reset_metrics() override {}
};

/**
 * @brief Scoped timer for automatic duration measurement
 */
class RSP_API ScopedTimer {
public:
    ScopedTimer(const std::shared_ptr<MetricsCollector>& collector,
                const std::string& metric_name);

    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    /**
     * @brief Get elapsed time in seconds
     */
    double get_elapsed() const;

    /**
     * @brief Stop timer manually (before destruction)
     */
    void stop();

private:
    std::shared_ptr<MetricsCollector> collector_;
    std::string metric_name_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point stop_time_;
    bool stopped_;
};

#define RSP_SCOPED_TIMER(collector, name) \
    rsp::monitoring::ScopedTimer _rsp_timer(collector, name)

} // namespace monitoring
} // namespace rsp
