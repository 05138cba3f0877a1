// include/termlease/observability.hpp
// Purpose: Metrics and health reporting for the orchestrator
// Counters and gauges owned by the orchestrator, exported through /api/health

#pragma once

#include "types.hpp"
#include <atomic>
#include <vector>
#include <string>
#include <unordered_map>
#include <memory>
#include <chrono>
#include <mutex>

namespace termlease {

//=============================================================================
// METRICS
//=============================================================================

enum class MetricType {
    COUNTER = 0,        // Monotonically increasing (sessions created, failures)
    GAUGE = 1,          // Current value (active sessions)
    HISTOGRAM = 2       // Value distribution (sweep and start latencies)
};

// Metric names
namespace Metrics {
    constexpr const char* SESSIONS_CREATED = "sessions.created";
    constexpr const char* SESSIONS_REJECTED_CAPACITY = "sessions.rejected.capacity";
    constexpr const char* SESSIONS_START_FAILURES = "sessions.start_failures";
    constexpr const char* SESSIONS_TERMINATED_EXPIRED = "sessions.terminated.expired";
    constexpr const char* SESSIONS_TERMINATED_DELETED = "sessions.terminated.deleted";
    constexpr const char* SESSIONS_TERMINATED_CRASHED = "sessions.terminated.crashed";
    constexpr const char* TEARDOWN_FAILURES = "teardown.failures";
    constexpr const char* SWEEPS_TOTAL = "sweeps.total";
    constexpr const char* SESSIONS_ACTIVE = "sessions.active";
    constexpr const char* WORKER_START_LATENCY_MS = "worker.start_latency_ms";
    constexpr const char* SWEEP_DURATION_MS = "sweep.duration_ms";
}

class ServerMetric {
public:
    ServerMetric(const std::string& name, MetricType type)
        : name_(name), type_(type), value_(0.0), count_(0), sum_(0.0) {}

    void increment(double delta = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ += delta;
        count_++;
    }

    void set(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = value;
    }

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        value_ = value;
        count_++;
    }

    double get_value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    uint64_t get_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    double get_average() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / count_ : 0.0;
    }

    const std::string& get_name() const { return name_; }
    MetricType get_type() const { return type_; }

private:
    std::string name_;
    MetricType type_;
    mutable std::mutex mutex_;
    double value_;
    uint64_t count_;
    double sum_;
};

// One registry per orchestrator, so tests get isolated counters
class MetricsRegistry {
public:
    std::shared_ptr<ServerMetric> counter(const std::string& name) {
        return create_metric(name, MetricType::COUNTER);
    }

    std::shared_ptr<ServerMetric> gauge(const std::string& name) {
        return create_metric(name, MetricType::GAUGE);
    }

    std::shared_ptr<ServerMetric> histogram(const std::string& name) {
        return create_metric(name, MetricType::HISTOGRAM);
    }

    std::shared_ptr<ServerMetric> get(const std::string& name) const;

    // Current value, 0 for unknown names
    double value(const std::string& name) const;

    // Name/value pairs sorted by name; histograms export their average
    std::vector<std::pair<std::string, double>> export_values() const;

private:
    std::shared_ptr<ServerMetric> create_metric(const std::string& name, MetricType type);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ServerMetric>> metrics_;
};

// Records elapsed milliseconds into a histogram on destruction
class ServerTimer {
public:
    explicit ServerTimer(std::shared_ptr<ServerMetric> metric)
        : metric_(std::move(metric)), start_(std::chrono::steady_clock::now()) {}

    ~ServerTimer() {
        finish();
    }

    void finish() {
        if (metric_) {
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            metric_->observe(static_cast<double>(duration));
            metric_.reset();
        }
    }

private:
    std::shared_ptr<ServerMetric> metric_;
    std::chrono::steady_clock::time_point start_;
};

//=============================================================================
// HEALTH
//=============================================================================

enum class HealthStatus {
    HEALTHY = 0,
    DEGRADED = 1,
    UNHEALTHY = 2
};

struct HealthReport {
    HealthStatus status;
    std::string message;
    size_t active_sessions = 0;
    size_t max_sessions = 0;
    size_t available_ports = 0;
    Timestamp last_sweep_at = 0;
    std::unordered_map<std::string, std::string> details;
    std::vector<std::pair<std::string, double>> metrics;
    Timestamp timestamp;

    HealthReport() : status(HealthStatus::HEALTHY), timestamp(Utils::now_milliseconds()) {}
};

std::string health_status_to_string(HealthStatus status);

} // namespace termlease
