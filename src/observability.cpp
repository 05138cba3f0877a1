// src/observability.cpp
// Implementation of the metrics registry

#include "termlease/observability.hpp"
#include <algorithm>

namespace termlease {

std::shared_ptr<ServerMetric> MetricsRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(name);
    return it != metrics_.end() ? it->second : nullptr;
}

double MetricsRegistry::value(const std::string& name) const {
    auto metric = get(name);
    return metric ? metric->get_value() : 0.0;
}

std::vector<std::pair<std::string, double>> MetricsRegistry::export_values() const {
    std::vector<std::pair<std::string, double>> values;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values.reserve(metrics_.size());
        for (const auto& pair : metrics_) {
            double value = pair.second->get_type() == MetricType::HISTOGRAM
                ? pair.second->get_average()
                : pair.second->get_value();
            values.emplace_back(pair.first, value);
        }
    }
    std::sort(values.begin(), values.end());
    return values;
}

std::shared_ptr<ServerMetric> MetricsRegistry::create_metric(const std::string& name, MetricType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        return it->second;
    }
    auto metric = std::make_shared<ServerMetric>(name, type);
    metrics_[name] = metric;
    return metric;
}

std::string health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return "healthy";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
        default: return "unknown";
    }
}

} // namespace termlease
