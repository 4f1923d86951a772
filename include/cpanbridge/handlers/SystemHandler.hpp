#pragma once

#include "cpanbridge/Config.hpp"
#include "cpanbridge/core/HandlePool.hpp"
#include "cpanbridge/core/MetricsCollector.hpp"
#include "cpanbridge/core/StaleReaper.hpp"
#include "cpanbridge/handlers/CapabilityHandler.hpp"
#include "cpanbridge/security/CapabilityRegistry.hpp"
#include "cpanbridge/security/Validator.hpp"

#include <functional>

namespace cpanbridge::handlers {

// Daemon internals exposed to the introspection endpoints.
struct SystemServices {
    const Config& config;
    HandlePool& pool;
    MetricsCollector& metrics;
    StaleReaper& reaper;
    const security::CapabilityRegistry& registry;
    const security::Validator& validator;
    // Returns true when a graceful stop was scheduled.
    std::function<bool()> request_shutdown;
};

// Reserved "test" module: ping, health, stats.
class TestHandler final : public CapabilityHandler {
public:
    explicit TestHandler(SystemServices services);

    std::string_view module() const noexcept override { return "test"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    SystemServices services_;
};

// Reserved "system" module: health, performance, connections, metrics, stats,
// cleanup, info, shutdown.
class SystemHandler final : public CapabilityHandler {
public:
    explicit SystemHandler(SystemServices services);

    std::string_view module() const noexcept override { return "system"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    Value health() const;
    Value performance() const;
    Value connections() const;
    Value metrics() const;
    Value cleanup();
    Value info() const;
    Value shutdown();

    SystemServices services_;
};

// "datetime_helper" module: now() reports whole Unix seconds.
class DateTimeHandler final : public CapabilityHandler {
public:
    std::string_view module() const noexcept override { return "datetime_helper"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;
};

// Shared by the test and system modules.
Value build_stats(const SystemServices& services);

}  // namespace cpanbridge::handlers
