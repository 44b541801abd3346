#include "rsp/monitoring/metrics_system.h"
#include <algorithm>

namespace rsp {
namespace monitoring {

void InMemoryMetricsCollector::record_duration(const std::string& name, double seconds) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    auto it = durations_.find(name);
    if (it == durations_.end()) {
        order_.push_back(name);
        DurationStats stats;
        stats.count = 1;
        stats.total_seconds = seconds;
        stats.min_seconds = seconds;
        stats.max_seconds = seconds;
        stats.last_seconds = seconds;
        durations_.emplace(name, stats);
        return;
    }

    auto& stats = it->second;
    stats.count++;
    stats.total_seconds += seconds;
    stats.min_seconds = std::min(stats.min_seconds, seconds);
    stats.max_seconds = std::max(stats.max_seconds, seconds);
    stats.last_seconds = seconds;
}

void InMemoryMetricsCollector::record_counter(const std::string& name, uint64_t value) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    counters_[name] += value;
}

MetricsSnapshot InMemoryMetricsCollector::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    MetricsSnapshot snapshot;
    snapshot.durations = durations_;
    snapshot.counters = counters_;
    return snapshot;
}

void InMemoryMetricsCollector::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    durations_.clear();
    counters_.clear();
    order_.clear();
}

std::vector<std::string> InMemoryMetricsCollector::recorded_names() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return order_;
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::shared_ptr<MetricsCollector>& collector,
                         const std::string& metric_name)
    : collector_(collector)
    , metric_name_(metric_name)
    , start_time_(std::chrono::steady_clock::now())
    , stopped_(false) {
}

ScopedTimer::~ScopedTimer() {
    if (!stopped_) {
        stop();
    }
}

double ScopedTimer::get_elapsed() const {
    auto end_time = stopped_ ? stop_time_ : std::chrono::steady_clock::now();
    return std::chrono::duration<double>(end_time - start_time_).count();
}

void ScopedTimer::stop() {
    if (!stopped_) {
        stop_time_ = std::chrono::steady_clock::now();
        stopped_ = true;
        if (collector_) {
            collector_->record_duration(metric_name_, get_elapsed());
        }
    }
}

} // namespace monitoring
} // namespace rsp
