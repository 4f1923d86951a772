#pragma once

#include "cpanbridge/Config.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cpanbridge {

struct ModuleStats {
    std::string name;  // "module.function"
    std::uint64_t requests{0};
    std::uint64_t failures{0};
    double avg_time_ms{0.0};
    double max_time_ms{0.0};
    double error_rate{0.0};
};

struct MetricsSnapshot {
    std::uint64_t total_requests{0};
    std::uint64_t successful_requests{0};
    std::uint64_t failed_requests{0};
    double avg_response_ms{0.0};
    double p95_response_ms{0.0};
    double p99_response_ms{0.0};
    double requests_per_second{0.0};
    double error_rate{0.0};
    double uptime_seconds{0.0};
    std::uint64_t requests_last_minute{0};
    std::vector<ModuleStats> modules;  // busiest first
};

struct SecuritySnapshot {
    std::uint64_t requests_rejected{0};
    std::uint64_t validation_failures{0};
    std::uint64_t total_events{0};
    std::map<std::string, std::uint64_t> events_by_type;
};

struct ConnectionSnapshot {
    std::uint64_t total{0};
    std::uint64_t active{0};
    std::uint64_t peak{0};
    std::uint64_t rejected{0};
    std::uint64_t transport_errors{0};
    std::uint64_t execution_timeouts{0};
};

struct HealthCheck {
    std::string name;
    std::string status;  // pass | warn | fail
    std::string message;
};

struct HealthInputs {
    std::size_t pool_size{0};
    std::size_t pool_capacity{0};
    std::chrono::milliseconds oldest_idle{0};
    bool reaper_running{false};
    std::chrono::seconds reaper_period{0};
    std::optional<std::chrono::milliseconds> since_last_reap;
    std::size_t max_connections{0};
    double memory_mb{0.0};
};

struct HealthReport {
    std::string overall_status;  // healthy | degraded | unhealthy
    std::vector<HealthCheck> checks;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

class MetricsCollector {
public:
    using Clock = std::chrono::steady_clock;

    explicit MetricsCollector(std::size_t window = 1000, HealthThresholds thresholds = {});

    void record(const std::string& module,
                const std::string& function,
                std::chrono::microseconds duration,
                bool success);

    void record_rejected(const std::string& reason);
    void record_validation_failure();
    void record_security_event(const std::string& type);

    void connection_opened();
    void connection_closed();
    void connection_rejected();
    void transport_error();
    void execution_timeout();

    MetricsSnapshot snapshot() const;
    SecuritySnapshot security() const;
    ConnectionSnapshot connections() const;
    HealthReport health(const HealthInputs& inputs) const;

    [[nodiscard]] double uptime_seconds() const;
    [[nodiscard]] std::chrono::system_clock::time_point started_at() const noexcept { return started_wall_; }

private:
    struct Accumulator {
        std::uint64_t requests{0};
        std::uint64_t failures{0};
        double total_ms{0.0};
        double max_ms{0.0};
    };

    std::size_t window_;
    HealthThresholds thresholds_;
    Clock::time_point started_;
    std::chrono::system_clock::time_point started_wall_;

    mutable std::mutex mutex_;
    std::uint64_t total_{0};
    std::uint64_t failed_{0};
    double total_ms_{0.0};
    std::deque<double> samples_ms_;
    std::deque<Clock::time_point> recent_;
    std::map<std::string, Accumulator> per_call_;

    std::uint64_t rejected_{0};
    std::uint64_t validation_failures_{0};
    std::map<std::string, std::uint64_t> security_events_;

    std::atomic<std::uint64_t> connections_total_{0};
    std::atomic<std::uint64_t> connections_active_{0};
    std::atomic<std::uint64_t> connections_peak_{0};
    std::atomic<std::uint64_t> connections_rejected_{0};
    std::atomic<std::uint64_t> transport_errors_{0};
    std::atomic<std::uint64_t> execution_timeouts_{0};
};

// Resident set size of this process in MiB, 0 when unavailable.
double process_memory_mb();

// Average CPU utilisation since process start, in percent of one core.
double process_cpu_percent(double uptime_seconds);

std::string format_uptime(double seconds);

}  // namespace cpanbridge
