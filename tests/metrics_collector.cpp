#include "cpanbridge/core/MetricsCollector.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace cpanbridge;
using std::chrono::microseconds;

namespace {

HealthInputs quiet_inputs() {
    HealthInputs inputs;
    inputs.pool_size = 1;
    inputs.pool_capacity = 100;
    inputs.reaper_running = true;
    inputs.reaper_period = std::chrono::seconds(60);
    inputs.max_connections = 100;
    return inputs;
}

const HealthCheck* find_check(const HealthReport& report, const std::string& name) {
    for (const auto& check : report.checks) {
        if (check.name == name) {
            return &check;
        }
    }
    return nullptr;
}

}  // namespace

int main() {
    {
        MetricsCollector metrics(1000);
        const auto empty = metrics.snapshot();
        assert(empty.total_requests == 0);
        assert(empty.error_rate == 0.0);
        assert(empty.p95_response_ms == 0.0);

        // Latencies 1..100 ms: nearest rank puts p95 at 95 and p99 at 99.
        for (int i = 1; i <= 100; ++i) {
            metrics.record("test", "ping", microseconds(i * 1000), i % 10 != 0);
        }
        const auto snapshot = metrics.snapshot();
        assert(snapshot.total_requests == 100);
        assert(snapshot.failed_requests == 10);
        assert(snapshot.successful_requests == 90);
        assert(snapshot.error_rate == 0.1);
        assert(snapshot.p95_response_ms == 95.0);
        assert(snapshot.p99_response_ms == 99.0);
        assert(snapshot.p95_response_ms <= snapshot.p99_response_ms);
        assert(snapshot.avg_response_ms == 50.5);
        assert(snapshot.requests_last_minute == 100);
        assert(snapshot.modules.size() == 1);
        assert(snapshot.modules.front().name == "test.ping");
        assert(snapshot.modules.front().max_time_ms == 100.0);

        metrics.record("database", "connect", microseconds(500), true);
        metrics.record("database", "connect", microseconds(500), false);
        const auto after = metrics.snapshot();
        assert(after.total_requests == 102);
        assert(after.modules.front().name == "test.ping");
        assert(after.modules.back().name == "database.connect");
        assert(after.modules.back().error_rate == 0.5);
        assert(after.error_rate >= 0.0 && after.error_rate <= 1.0);
    }

    {
        // The percentile window only keeps the latest samples.
        MetricsCollector metrics(10);
        for (int i = 0; i < 50; ++i) {
            metrics.record("slow", "call", microseconds(900'000), true);
        }
        for (int i = 0; i < 10; ++i) {
            metrics.record("fast", "call", microseconds(1000), true);
        }
        const auto snapshot = metrics.snapshot();
        assert(snapshot.total_requests == 60);
        assert(snapshot.p99_response_ms == 1.0);
    }

    {
        MetricsCollector metrics;
        constexpr int kThreads = 6;
        constexpr int kCalls = 500;
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&] {
                for (int i = 0; i < kCalls; ++i) {
                    metrics.record("test", "ping", microseconds(10), true);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        assert(metrics.snapshot().total_requests == static_cast<std::uint64_t>(kThreads * kCalls));
    }

    {
        MetricsCollector metrics;
        metrics.record_rejected("unauthorized_function");
        metrics.record_rejected("dangerous_name");
        metrics.record_validation_failure();
        const auto security = metrics.security();
        assert(security.requests_rejected == 2);
        assert(security.validation_failures == 1);
        assert(security.total_events == 3);
        assert(security.events_by_type.at("dangerous_name") == 1);

        metrics.connection_opened();
        metrics.connection_opened();
        metrics.connection_closed();
        metrics.connection_rejected();
        metrics.transport_error();
        metrics.execution_timeout();
        const auto connections = metrics.connections();
        assert(connections.total == 2);
        assert(connections.active == 1);
        assert(connections.peak == 2);
        assert(connections.rejected == 1);
        assert(connections.transport_errors == 1);
        assert(connections.execution_timeouts == 1);
    }

    {
        MetricsCollector metrics;
        const auto healthy = metrics.health(quiet_inputs());
        assert(healthy.overall_status == "healthy");
        assert(find_check(healthy, "error_rate")->status == "pass");

        auto inputs = quiet_inputs();
        inputs.reaper_running = false;
        const auto unhealthy = metrics.health(inputs);
        assert(unhealthy.overall_status == "unhealthy");
        assert(!unhealthy.errors.empty());

        inputs = quiet_inputs();
        inputs.pool_size = 90;
        const auto degraded = metrics.health(inputs);
        assert(degraded.overall_status == "degraded");
        assert(find_check(degraded, "handle_pool")->status == "warn");

        for (int i = 0; i < 30; ++i) {
            metrics.record("crypto", "decrypt", microseconds(100), false);
        }
        assert(find_check(metrics.health(quiet_inputs()), "error_rate")->status == "fail");
    }

    assert(format_uptime(3725.0) == "1h 2m 5s");
    assert(format_uptime(59.9) == "59s");
    assert(process_memory_mb() >= 0.0);

    return 0;
}
