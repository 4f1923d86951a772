#include "cpanbridge/handlers/SystemHandler.hpp"

#include "cpanbridge/Version.hpp"
#include "cpanbridge/core/ConfigLoader.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace cpanbridge::handlers {

namespace {

constexpr std::size_t kTopModules = 10;

double unix_now() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string iso_time(std::chrono::system_clock::time_point at) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(at);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

double ms_to_seconds(double ms) {
    return ms / 1000.0;
}

double seconds_of(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

Value count_of(std::size_t value) {
    return Value(static_cast<std::uint64_t>(value));
}

Value performance_metrics(const MetricsSnapshot& snapshot) {
    Value metrics(Json::objectValue);
    metrics["total_requests"] = Value(snapshot.total_requests);
    metrics["successful_requests"] = Value(snapshot.successful_requests);
    metrics["failed_requests"] = Value(snapshot.failed_requests);
    metrics["avg_response_time"] = Value(ms_to_seconds(snapshot.avg_response_ms));
    metrics["p95_response_time"] = Value(ms_to_seconds(snapshot.p95_response_ms));
    metrics["p99_response_time"] = Value(ms_to_seconds(snapshot.p99_response_ms));
    metrics["requests_per_second"] = Value(snapshot.requests_per_second);
    metrics["requests_per_minute"] = Value(snapshot.requests_last_minute);
    metrics["error_rate"] = Value(snapshot.error_rate);
    metrics["uptime_seconds"] = Value(snapshot.uptime_seconds);
    return metrics;
}

HealthInputs collect_health_inputs(const SystemServices& services) {
    HealthInputs inputs;
    const auto handles = services.pool.snapshot();
    inputs.pool_size = handles.size();
    inputs.pool_capacity = services.pool.capacity();
    for (const auto& handle : handles) {
        inputs.oldest_idle = std::max(inputs.oldest_idle, handle.idle);
    }
    inputs.reaper_running = services.reaper.running();
    inputs.reaper_period = services.reaper.period();
    if (const auto last = services.reaper.last_cycle()) {
        inputs.since_last_reap = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - *last);
    }
    inputs.max_connections = services.config.max_connections;
    inputs.memory_mb = process_memory_mb();
    return inputs;
}

std::string recommendation_for(const std::string& check) {
    if (check == "error_rate") {
        return "Investigate the capabilities with the highest error rate";
    }
    if (check == "response_time") {
        return "Check slow downstream services or raise their timeouts";
    }
    if (check == "handle_pool") {
        return "Lower idle thresholds or raise max_handles";
    }
    if (check == "connections") {
        return "Raise max_connections or reduce client concurrency";
    }
    if (check == "reaper") {
        return "Restart the daemon to recover the stale reaper";
    }
    if (check == "stale_resources") {
        return "Review clients that leave handles open";
    }
    if (check == "memory") {
        return "Look for leaked handles with system.connections";
    }
    return "Review daemon logs";
}

bool is_stale(const HandleInfo& handle, const StaleReaper& reaper) {
    return handle.idle > std::chrono::duration_cast<std::chrono::milliseconds>(reaper.threshold_for(handle.kind));
}

}  // namespace

Value build_stats(const SystemServices& services) {
    const auto snapshot = services.metrics.snapshot();
    const auto security = services.metrics.security();
    const auto connections = services.metrics.connections();
    const auto pool = services.pool.stats();
    const auto& limits = services.validator.limits();

    Value stats(Json::objectValue);
    stats["requests_processed"] = Value(snapshot.total_requests);
    stats["requests_failed"] = Value(snapshot.failed_requests);
    stats["requests_rejected"] = Value(security.requests_rejected);
    stats["validation_failures"] = Value(security.validation_failures);
    stats["security_events"] = Value(security.total_events);

    auto& security_metrics = stats["security_metrics"];
    security_metrics["total_events"] = Value(security.total_events);
    security_metrics["events_by_type"] = Value(Json::objectValue);
    auto& by_type = security_metrics["events_by_type"];
    for (const auto& [type, count] : security.events_by_type) {
        by_type[type] = Value(count);
    }

    stats["connections_total"] = Value(connections.total);
    stats["active_connections"] = Value(connections.active);
    stats["peak_connections"] = Value(connections.peak);
    stats["connections_rejected"] = Value(connections.rejected);
    stats["transport_errors"] = Value(connections.transport_errors);
    stats["execution_timeouts"] = Value(connections.execution_timeouts);

    auto& summary = stats["performance_summary"];
    summary["total_requests"] = Value(snapshot.total_requests);
    summary["avg_response_time"] = Value(ms_to_seconds(snapshot.avg_response_ms));
    summary["requests_per_second"] = Value(snapshot.requests_per_second);
    summary["error_rate"] = Value(snapshot.error_rate);

    auto& validation = stats["validation_config"];
    validation["strict_mode"] = Value(true);
    validation["max_string_length"] = count_of(limits.max_string_length);
    validation["max_array_length"] = count_of(limits.max_array_length);
    validation["max_object_depth"] = count_of(limits.max_object_depth);
    validation["max_param_count"] = count_of(limits.max_param_count);

    auto& handles = stats["handles"];
    handles["total"] = count_of(pool.total);
    handles["per_kind"] = Value(Json::objectValue);
    auto& per_kind = handles["per_kind"];
    for (const auto& [kind, count] : pool.per_kind) {
        per_kind[kind] = count_of(count);
    }
    return stats;
}

TestHandler::TestHandler(SystemServices services)
    : services_(std::move(services)) {}

std::vector<std::string> TestHandler::functions() const {
    return {"ping", "health", "stats"};
}

Value TestHandler::invoke(const std::string& function, const Value& params, HandlerContext&) {
    if (function == "ping") {
        Value result(Json::objectValue);
        result["message"] = "pong";
        result["daemon_version"] = Value(std::string(kDaemonVersion));
        result["uptime"] = Value(services_.metrics.uptime_seconds());
        result["timestamp"] = Value(unix_now());
        result["input"] = params.isNull() ? Value(Json::objectValue) : params;
        return result;
    }
    if (function == "health") {
        const auto report = services_.metrics.health(collect_health_inputs(services_));
        Value result(Json::objectValue);
        result["status"] = Value(report.overall_status);
        result["daemon_version"] = Value(std::string(kDaemonVersion));
        result["uptime"] = Value(services_.metrics.uptime_seconds());
        result["active_connections"] = Value(services_.metrics.connections().active);
        result["loaded_modules"] = string_array(services_.registry.modules());
        result["handles"] = count_of(services_.pool.size());
        result["stats"] = build_stats(services_);
        return result;
    }
    if (function == "stats") {
        return build_stats(services_);
    }
    throw BridgeError(ErrorKind::Validation, "Unknown test function: " + function);
}

std::vector<std::string> DateTimeHandler::functions() const {
    return {"now"};
}

Value DateTimeHandler::invoke(const std::string& function, const Value&, HandlerContext&) {
    if (function != "now") {
        throw BridgeError(ErrorKind::Validation, "Unknown datetime_helper function: " + function);
    }
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());
    Value result(Json::objectValue);
    result["epoch"] = Value(static_cast<std::int64_t>(seconds.count()));
    return result;
}

SystemHandler::SystemHandler(SystemServices services)
    : services_(std::move(services)) {}

std::vector<std::string> SystemHandler::functions() const {
    return {"health", "performance", "connections", "metrics", "stats", "cleanup", "info", "shutdown"};
}

Value SystemHandler::invoke(const std::string& function, const Value&, HandlerContext&) {
    if (function == "health") {
        return health();
    }
    if (function == "performance") {
        return performance();
    }
    if (function == "connections") {
        return connections();
    }
    if (function == "metrics") {
        return metrics();
    }
    if (function == "stats") {
        return build_stats(services_);
    }
    if (function == "cleanup") {
        return cleanup();
    }
    if (function == "info") {
        return info();
    }
    if (function == "shutdown") {
        return shutdown();
    }
    throw BridgeError(ErrorKind::Validation, "Unknown system function: " + function);
}

Value SystemHandler::health() const {
    const auto report = services_.metrics.health(collect_health_inputs(services_));

    Value result(Json::objectValue);
    result["overall_status"] = Value(report.overall_status);
    result["timestamp"] = Value(unix_now());
    result["checks"] = Value(Json::objectValue);
    auto& checks = result["checks"];
    for (const auto& check : report.checks) {
        Value entry(Json::objectValue);
        entry["status"] = Value(check.status);
        entry["message"] = Value(check.message);
        checks[check.name] = std::move(entry);
    }
    result["warnings"] = string_array(report.warnings);
    result["errors"] = string_array(report.errors);
    return result;
}

Value SystemHandler::performance() const {
    const auto snapshot = services_.metrics.snapshot();
    const auto report = services_.metrics.health(collect_health_inputs(services_));

    Value result(Json::objectValue);
    result["performance_metrics"] = performance_metrics(snapshot);

    auto& modules = result["module_performance"];
    modules["top_modules"] = Value(Json::arrayValue);
    auto& top = modules["top_modules"];
    for (std::size_t i = 0; i < snapshot.modules.size() && i < kTopModules; ++i) {
        const auto& stats = snapshot.modules[i];
        Value entry(Json::objectValue);
        entry["module_function"] = Value(stats.name);
        entry["requests"] = Value(stats.requests);
        entry["avg_time_ms"] = Value(stats.avg_time_ms);
        entry["max_time_ms"] = Value(stats.max_time_ms);
        entry["error_rate"] = Value(stats.error_rate);
        top.append(std::move(entry));
    }
    modules["total_modules"] = count_of(snapshot.modules.size());

    auto& indicators = result["health_indicators"];
    indicators["overall_health"] = Value(report.overall_status);
    indicators["concerns"] = Value(Json::arrayValue);
    auto& concerns = indicators["concerns"];
    indicators["recommendations"] = Value(Json::arrayValue);
    auto& recommendations = indicators["recommendations"];
    for (const auto& check : report.checks) {
        if (check.status == "pass") {
            continue;
        }
        concerns.append(check.name + ": " + check.message);
        recommendations.append(recommendation_for(check.name));
    }
    return result;
}

Value SystemHandler::connections() const {
    const auto handles = services_.pool.snapshot();
    const auto sockets = services_.metrics.connections();

    Value result(Json::objectValue);
    std::size_t stale = 0;
    result["connections"] = Value(Json::arrayValue);
    auto& entries = result["connections"];
    for (const auto& handle : handles) {
        const bool handle_stale = is_stale(handle, services_.reaper);
        if (handle_stale) {
            ++stale;
        }
        Value entry(Json::objectValue);
        entry["connection_id"] = Value(handle.id);
        entry["kind"] = Value(std::string(handle_kind_to_string(handle.kind)));
        entry["owner"] = Value(handle.owner);
        entry["duration_seconds"] = Value(seconds_of(handle.age));
        entry["idle_time"] = Value(seconds_of(handle.idle));
        entry["requests_count"] = Value(handle.use_count);
        entry["status"] = handle_stale ? "stale" : "active";
        entries.append(std::move(entry));
    }
    result["total_connections"] = count_of(handles.size());
    result["active_connections"] = count_of(handles.size() - stale);
    result["stale_connections"] = count_of(stale);

    auto& limits = result["connection_limits"];
    limits["max_concurrent"] = count_of(services_.config.max_connections);
    limits["stale_timeout"] = Value(static_cast<std::int64_t>(services_.config.idle_threshold.count()));
    limits["max_handles"] = count_of(services_.pool.capacity());

    auto& socket = result["socket"];
    socket["active"] = Value(sockets.active);
    socket["total"] = Value(sockets.total);
    socket["peak"] = Value(sockets.peak);
    socket["rejected"] = Value(sockets.rejected);
    return result;
}

Value SystemHandler::metrics() const {
    const auto snapshot = services_.metrics.snapshot();
    const auto security = services_.metrics.security();
    const auto sockets = services_.metrics.connections();
    const auto handles = services_.pool.snapshot();
    const auto modules = services_.registry.modules();

    std::size_t stale = 0;
    for (const auto& handle : handles) {
        if (is_stale(handle, services_.reaper)) {
            ++stale;
        }
    }

    Value result(Json::objectValue);
    result["timestamp"] = Value(unix_now());

    auto& daemon_info = result["daemon_info"];
    daemon_info["version"] = Value(std::string(kDaemonVersion));
    daemon_info["pid"] = Value(static_cast<std::int64_t>(::getpid()));
    daemon_info["uptime_seconds"] = Value(snapshot.uptime_seconds);
    daemon_info["uptime_formatted"] = Value(format_uptime(snapshot.uptime_seconds));
    daemon_info["socket_path"] = Value(services_.config.socket_path);

    auto& resources = result["resource_status"];
    resources["memory_mb"] = Value(process_memory_mb());
    resources["cpu_percent"] = Value(process_cpu_percent(snapshot.uptime_seconds));
    resources["requests_per_minute"] = Value(snapshot.requests_last_minute);
    resources["handles_in_use"] = count_of(handles.size());
    resources["handle_capacity"] = count_of(services_.pool.capacity());

    result["performance_metrics"] = performance_metrics(snapshot);

    auto& security_summary = result["security_summary"];
    security_summary["total_security_events"] = Value(security.total_events);
    security_summary["validation_failures"] = Value(security.validation_failures);
    security_summary["requests_rejected"] = Value(security.requests_rejected);

    auto& connection_summary = result["connection_summary"];
    connection_summary["total_connections"] = count_of(handles.size());
    connection_summary["active_connections"] = count_of(handles.size() - stale);
    connection_summary["stale_connections"] = count_of(stale);
    connection_summary["socket_connections_active"] = Value(sockets.active);
    connection_summary["socket_connections_peak"] = Value(sockets.peak);

    auto& module_status = result["module_status"];
    module_status["loaded_modules"] = count_of(modules.size());
    module_status["available_modules"] = string_array(modules);
    return result;
}

Value SystemHandler::cleanup() {
    const auto report = services_.reaper.run_once();

    Value result(Json::objectValue);
    result["cleaned_connections"] = count_of(report.cleaned);
    result["remaining_connections"] = count_of(report.remaining);
    result["connections_details"] = Value(Json::arrayValue);
    auto& details = result["connections_details"];
    for (const auto& entry : report.details) {
        Value item(Json::objectValue);
        item["connection_id"] = Value(entry.id);
        item["kind"] = Value(std::string(handle_kind_to_string(entry.kind)));
        item["idle_time"] = Value(seconds_of(entry.idle));
        details.append(std::move(item));
    }
    return result;
}

Value SystemHandler::info() const {
    Value result(Json::objectValue);
    result["daemon_version"] = Value(std::string(kDaemonVersion));
    result["pid"] = Value(static_cast<std::int64_t>(::getpid()));
    result["started_at"] = Value(iso_time(services_.metrics.started_at()));
    result["uptime"] = Value(services_.metrics.uptime_seconds());
    result["socket_path"] = Value(services_.config.socket_path);
    result["config"] = describe_config(services_.config);
    result["capabilities"] = Value(Json::objectValue);
    auto& capabilities = result["capabilities"];
    for (const auto& [module, functions] : services_.registry.capabilities()) {
        capabilities[module] = string_array(functions);
    }
    return result;
}

Value SystemHandler::shutdown() {
    const bool scheduled = services_.request_shutdown ? services_.request_shutdown() : false;
    Value result(Json::objectValue);
    result["shutdown_requested"] = Value(scheduled);
    result["message"] = scheduled ? "Daemon is shutting down" : "Shutdown is not available in this process";
    return result;
}

}  // namespace cpanbridge::handlers
