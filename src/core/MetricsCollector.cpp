#include "cpanbridge/core/MetricsCollector.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

#include <sys/resource.h>
#include <unistd.h>

namespace cpanbridge {

namespace {

constexpr std::chrono::seconds kRecentWindow{std::chrono::seconds(60)};

// Nearest-rank percentile over an ascending sequence.
double nearest_rank(const std::vector<double>& sorted, double percentile) {
    if (sorted.empty()) {
        return 0.0;
    }
    const auto rank = static_cast<std::size_t>(std::ceil(percentile / 100.0 * static_cast<double>(sorted.size())));
    const auto index = std::min(sorted.size(), std::max<std::size_t>(rank, 1)) - 1;
    return sorted[index];
}

void add_check(HealthReport& report, std::string name, std::string status, std::string message) {
    if (status == "warn") {
        report.warnings.push_back(name + ": " + message);
    } else if (status == "fail") {
        report.errors.push_back(name + ": " + message);
    }
    report.checks.push_back({std::move(name), std::move(status), std::move(message)});
}

std::string format_ratio(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << value * 100.0 << '%';
    return oss.str();
}

std::string format_ms(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << value << "ms";
    return oss.str();
}

}  // namespace

MetricsCollector::MetricsCollector(std::size_t window, HealthThresholds thresholds)
    : window_(std::max<std::size_t>(window, 1)),
      thresholds_(thresholds),
      started_(Clock::now()),
      started_wall_(std::chrono::system_clock::now()) {}

void MetricsCollector::record(const std::string& module,
                              const std::string& function,
                              std::chrono::microseconds duration,
                              bool success) {
    const auto now = Clock::now();
    const double duration_ms = static_cast<double>(duration.count()) / 1000.0;

    std::scoped_lock lock(mutex_);
    ++total_;
    if (!success) {
        ++failed_;
    }
    total_ms_ += duration_ms;

    samples_ms_.push_back(duration_ms);
    while (samples_ms_.size() > window_) {
        samples_ms_.pop_front();
    }

    recent_.push_back(now);
    while (!recent_.empty() && now - recent_.front() > kRecentWindow) {
        recent_.pop_front();
    }

    auto& call = per_call_[module + "." + function];
    ++call.requests;
    if (!success) {
        ++call.failures;
    }
    call.total_ms += duration_ms;
    call.max_ms = std::max(call.max_ms, duration_ms);
}

void MetricsCollector::record_rejected(const std::string& reason) {
    std::scoped_lock lock(mutex_);
    ++rejected_;
    ++security_events_[reason];
}

void MetricsCollector::record_validation_failure() {
    std::scoped_lock lock(mutex_);
    ++validation_failures_;
    ++security_events_["validation_failure"];
}

void MetricsCollector::record_security_event(const std::string& type) {
    std::scoped_lock lock(mutex_);
    ++security_events_[type];
}

void MetricsCollector::connection_opened() {
    connections_total_.fetch_add(1, std::memory_order_relaxed);
    const auto active = connections_active_.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto peak = connections_peak_.load(std::memory_order_relaxed);
    while (active > peak && !connections_peak_.compare_exchange_weak(peak, active, std::memory_order_relaxed)) {
    }
}

void MetricsCollector::connection_closed() {
    connections_active_.fetch_sub(1, std::memory_order_acq_rel);
}

void MetricsCollector::connection_rejected() {
    connections_rejected_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::transport_error() {
    transport_errors_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::execution_timeout() {
    execution_timeouts_.fetch_add(1, std::memory_order_relaxed);
}

double MetricsCollector::uptime_seconds() const {
    return std::chrono::duration<double>(Clock::now() - started_).count();
}

MetricsSnapshot MetricsCollector::snapshot() const {
    MetricsSnapshot snapshot;
    snapshot.uptime_seconds = uptime_seconds();
    const auto now = Clock::now();

    std::vector<double> sorted;
    {
        std::scoped_lock lock(mutex_);
        snapshot.total_requests = total_;
        snapshot.failed_requests = failed_;
        snapshot.successful_requests = total_ - failed_;
        snapshot.avg_response_ms = total_ > 0 ? total_ms_ / static_cast<double>(total_) : 0.0;
        snapshot.error_rate = total_ > 0 ? static_cast<double>(failed_) / static_cast<double>(total_) : 0.0;
        snapshot.requests_last_minute = static_cast<std::uint64_t>(
            std::count_if(recent_.begin(), recent_.end(), [&](const auto& at) { return now - at <= kRecentWindow; }));
        sorted.assign(samples_ms_.begin(), samples_ms_.end());

        snapshot.modules.reserve(per_call_.size());
        for (const auto& [name, call] : per_call_) {
            ModuleStats stats;
            stats.name = name;
            stats.requests = call.requests;
            stats.failures = call.failures;
            stats.avg_time_ms = call.requests > 0 ? call.total_ms / static_cast<double>(call.requests) : 0.0;
            stats.max_time_ms = call.max_ms;
            stats.error_rate = call.requests > 0 ? static_cast<double>(call.failures) / static_cast<double>(call.requests) : 0.0;
            snapshot.modules.push_back(std::move(stats));
        }
    }

    std::sort(sorted.begin(), sorted.end());
    snapshot.p95_response_ms = nearest_rank(sorted, 95.0);
    snapshot.p99_response_ms = nearest_rank(sorted, 99.0);
    snapshot.requests_per_second = snapshot.uptime_seconds > 0.0
                                       ? static_cast<double>(snapshot.total_requests) / snapshot.uptime_seconds
                                       : 0.0;
    std::stable_sort(snapshot.modules.begin(), snapshot.modules.end(), [](const ModuleStats& lhs, const ModuleStats& rhs) {
        return lhs.requests > rhs.requests;
    });
    return snapshot;
}

SecuritySnapshot MetricsCollector::security() const {
    SecuritySnapshot snapshot;
    std::scoped_lock lock(mutex_);
    snapshot.requests_rejected = rejected_;
    snapshot.validation_failures = validation_failures_;
    snapshot.events_by_type = security_events_;
    for (const auto& [type, count] : security_events_) {
        snapshot.total_events += count;
    }
    return snapshot;
}

ConnectionSnapshot MetricsCollector::connections() const {
    ConnectionSnapshot snapshot;
    snapshot.total = connections_total_.load(std::memory_order_relaxed);
    snapshot.active = connections_active_.load(std::memory_order_relaxed);
    snapshot.peak = connections_peak_.load(std::memory_order_relaxed);
    snapshot.rejected = connections_rejected_.load(std::memory_order_relaxed);
    snapshot.transport_errors = transport_errors_.load(std::memory_order_relaxed);
    snapshot.execution_timeouts = execution_timeouts_.load(std::memory_order_relaxed);
    return snapshot;
}

HealthReport MetricsCollector::health(const HealthInputs& inputs) const {
    HealthReport report;
    const auto metrics = snapshot();
    const auto conns = connections();

    if (inputs.pool_capacity > 0) {
        const double saturation = static_cast<double>(inputs.pool_size) / static_cast<double>(inputs.pool_capacity);
        const std::string message = std::to_string(inputs.pool_size) + " of " + std::to_string(inputs.pool_capacity) +
                                    " handles in use";
        if (saturation >= 1.0) {
            add_check(report, "handle_pool", "fail", message);
        } else if (saturation >= thresholds_.saturation_warn) {
            add_check(report, "handle_pool", "warn", message);
        } else {
            add_check(report, "handle_pool", "pass", message);
        }
    }

    if (metrics.total_requests < thresholds_.error_rate_min_requests) {
        add_check(report, "error_rate", "pass", "Not enough requests to judge (" + std::to_string(metrics.total_requests) + ")");
    } else if (metrics.error_rate > thresholds_.error_rate_fail) {
        add_check(report, "error_rate", "fail", "Error rate " + format_ratio(metrics.error_rate));
    } else if (metrics.error_rate > thresholds_.error_rate_warn) {
        add_check(report, "error_rate", "warn", "Error rate " + format_ratio(metrics.error_rate));
    } else {
        add_check(report, "error_rate", "pass", "Error rate " + format_ratio(metrics.error_rate));
    }

    if (metrics.p95_response_ms > thresholds_.latency_fail_ms) {
        add_check(report, "response_time", "fail", "p95 latency " + format_ms(metrics.p95_response_ms));
    } else if (metrics.p95_response_ms > thresholds_.latency_warn_ms) {
        add_check(report, "response_time", "warn", "p95 latency " + format_ms(metrics.p95_response_ms));
    } else {
        add_check(report, "response_time", "pass", "p95 latency " + format_ms(metrics.p95_response_ms));
    }

    const auto age_limit = std::chrono::duration_cast<std::chrono::milliseconds>(thresholds_.resource_age_warn);
    if (inputs.oldest_idle > age_limit) {
        add_check(report,
                  "stale_resources",
                  "warn",
                  "A handle has been idle for " + std::to_string(inputs.oldest_idle.count() / 1000) + "s");
    } else {
        add_check(report, "stale_resources", "pass", "No long-idle handles");
    }

    if (!inputs.reaper_running) {
        add_check(report, "reaper", "fail", "Stale reaper is not running");
    } else if (inputs.since_last_reap &&
               *inputs.since_last_reap > std::chrono::duration_cast<std::chrono::milliseconds>(inputs.reaper_period * 3)) {
        add_check(report, "reaper", "warn", "Stale reaper has not completed a cycle recently");
    } else {
        add_check(report, "reaper", "pass", "Stale reaper running every " + std::to_string(inputs.reaper_period.count()) + "s");
    }

    if (inputs.max_connections > 0) {
        const double saturation = static_cast<double>(conns.active) / static_cast<double>(inputs.max_connections);
        const std::string message = std::to_string(conns.active) + " of " + std::to_string(inputs.max_connections) +
                                    " connections active";
        if (saturation >= 1.0) {
            add_check(report, "connections", "fail", message);
        } else if (saturation >= thresholds_.saturation_warn) {
            add_check(report, "connections", "warn", message);
        } else {
            add_check(report, "connections", "pass", message);
        }
    }

    if (inputs.memory_mb > thresholds_.memory_warn_mb) {
        add_check(report, "memory", "warn", "Resident memory " + std::to_string(static_cast<long>(inputs.memory_mb)) + " MiB");
    } else {
        add_check(report, "memory", "pass", "Resident memory " + std::to_string(static_cast<long>(inputs.memory_mb)) + " MiB");
    }

    if (!report.errors.empty()) {
        report.overall_status = "unhealthy";
    } else if (!report.warnings.empty()) {
        report.overall_status = "degraded";
    } else {
        report.overall_status = "healthy";
    }
    return report;
}

double process_memory_mb() {
    std::ifstream statm("/proc/self/statm");
    std::uint64_t size_pages = 0;
    std::uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return 0.0;
    }
    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return 0.0;
    }
    return static_cast<double>(resident_pages) * static_cast<double>(page_size) / (1024.0 * 1024.0);
}

double process_cpu_percent(double uptime_seconds) {
    if (uptime_seconds <= 0.0) {
        return 0.0;
    }
    rusage usage{};
    if (::getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    const double cpu_seconds = static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
                               static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
    return cpu_seconds / uptime_seconds * 100.0;
}

std::string format_uptime(double seconds) {
    auto total = static_cast<std::uint64_t>(seconds);
    const auto days = total / 86'400;
    total %= 86'400;
    const auto hours = total / 3'600;
    total %= 3'600;
    const auto minutes = total / 60;
    const auto secs = total % 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d ";
    }
    if (days > 0 || hours > 0) {
        oss << hours << "h ";
    }
    if (days > 0 || hours > 0 || minutes > 0) {
        oss << minutes << "m ";
    }
    oss << secs << 's';
    return oss.str();
}

}  // namespace cpanbridge
