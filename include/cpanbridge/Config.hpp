#pragma once

#include "cpanbridge/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cpanbridge {

struct ValidationLimits {
    std::size_t max_string_length{1024 * 1024};
    std::size_t max_array_length{10'000};
    std::size_t max_object_depth{32};
    std::size_t max_param_count{10'000};
};

struct HealthThresholds {
    double error_rate_warn{0.05};
    double error_rate_fail{0.25};
    // Error-rate checks stay at "pass" until this many requests were seen.
    std::uint64_t error_rate_min_requests{20};
    double latency_warn_ms{1000.0};
    double latency_fail_ms{5000.0};
    double saturation_warn{0.8};
    double memory_warn_mb{1024.0};
    std::chrono::seconds resource_age_warn{std::chrono::hours(1)};
};

struct Config {
    std::string socket_path{"/tmp/cpan_bridge.sock"};
    std::size_t max_connections{100};
    std::size_t max_request_bytes{10ull * 1024ull * 1024ull};
    std::chrono::seconds request_timeout{std::chrono::seconds(30)};
    std::chrono::seconds execution_timeout{std::chrono::minutes(5)};
    std::chrono::seconds reaper_period{std::chrono::seconds(60)};
    std::chrono::seconds idle_threshold{std::chrono::minutes(5)};
    std::map<HandleKind, std::chrono::seconds> idle_thresholds;
    std::size_t max_handles{10'000};
    std::size_t metrics_window{1000};
    std::string log_level{"info"};
    std::optional<std::string> log_file{};
    bool debug{false};
    ValidationLimits limits{};
    HealthThresholds health{};

    // Optional narrowing of the registered capabilities: module -> functions.
    std::optional<std::map<std::string, std::vector<std::string>>> whitelist{};

    [[nodiscard]] std::chrono::seconds idle_threshold_for(HandleKind kind) const {
        const auto it = idle_thresholds.find(kind);
        return it != idle_thresholds.end() ? it->second : idle_threshold;
    }
};

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {})
        : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
        if (!code.empty()) {
            formatted = "[" + code + "] " + message;
        } else {
            formatted = message;
        }
    }

    const char* what() const noexcept override { return formatted.c_str(); }
};

}  // namespace cpanbridge
