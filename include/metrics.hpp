#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace passgen {

// Well-known metric names.
namespace metric {
inline constexpr const char* HTTP_REQUESTS = "http_requests_total";
inline constexpr const char* PASSWORDS_GENERATED = "passwords_generated_total";
inline constexpr const char* GENERATE_REJECTED = "generate_rejected_total";
inline constexpr const char* GENERATE_FAILED = "generate_failed_total";
inline constexpr const char* CONNECTIONS_REJECTED = "connections_rejected_total";
inline constexpr const char* ACTIVE_CONNECTIONS = "active_connections";
}

enum class MetricKind {
    Counter,
    Gauge
};

// Process-wide registry of named counters and gauges, exported in Prometheus text format.
// The service's own series are declared up front so /metrics lists them before first use.
// A name is bound to one kind; using it as the other throws std::logic_error.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        series(name, MetricKind::Counter).value += value;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        series(name, MetricKind::Gauge).value = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        series(name, MetricKind::Gauge).value += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        series(name, MetricKind::Gauge).value -= value;
    }

    double get_counter(const std::string& name) {
        return read(name, MetricKind::Counter);
    }

    double get_gauge(const std::string& name) {
        return read(name, MetricKind::Gauge);
    }

    // Zeroes the service series and forgets any other name. Tests only.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        series_.clear();
        declare_service_series();
    }

    /**
     * Serializes every series into Prometheus exposition format (text version 0.0.4),
     * with a HELP line where one was declared.
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, s] : series_) {
            if (!s.help.empty()) {
                ss << "# HELP " << name << " " << s.help << "\n";
            }
            ss << "# TYPE " << name << " " << (s.kind == MetricKind::Counter ? "counter" : "gauge") << "\n";
            ss << name << " " << s.value << "\n";
        }

        return ss.str();
    }

private:
    struct Series {
        MetricKind kind;
        std::string help;
        double value = 0.0;
    };

    MetricsRegistry() {
        declare_service_series();
    }

    void declare_service_series() {
        declare(metric::HTTP_REQUESTS, MetricKind::Counter, "HTTP responses written, any status.");
        declare(metric::PASSWORDS_GENERATED, MetricKind::Counter, "Passwords returned with status 200.");
        declare(metric::GENERATE_REJECTED, MetricKind::Counter, "Generate requests rejected with status 400.");
        declare(metric::GENERATE_FAILED, MetricKind::Counter, "Generate requests that failed with status 500.");
        declare(metric::CONNECTIONS_REJECTED, MetricKind::Counter, "Connections refused at the session ceiling.");
        declare(metric::ACTIVE_CONNECTIONS, MetricKind::Gauge, "Open HTTP sessions.");
    }

    void declare(const std::string& name, MetricKind kind, const std::string& help) {
        series_[name] = Series{kind, help, 0.0};
    }

    // Caller holds mutex_.
    Series& series(const std::string& name, MetricKind kind) {
        auto it = series_.find(name);
        if (it == series_.end()) {
            it = series_.emplace(name, Series{kind, std::string(), 0.0}).first;
        } else if (it->second.kind != kind) {
            throw std::logic_error("metric '" + name + "' is registered with a different kind");
        }
        return it->second;
    }

    double read(const std::string& name, MetricKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series_.find(name);
        if (it == series_.end() || it->second.kind != kind) return 0.0;
        return it->second.value;
    }

    std::map<std::string, Series> series_;
    std::mutex mutex_;
};

}
