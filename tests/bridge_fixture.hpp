#pragma once

#include "cpanbridge/Config.hpp"
#include "cpanbridge/core/HandlePool.hpp"
#include "cpanbridge/core/MetricsCollector.hpp"
#include "cpanbridge/core/StaleReaper.hpp"
#include "cpanbridge/daemon/Dispatcher.hpp"
#include "cpanbridge/handlers/CipherHandler.hpp"
#include "cpanbridge/handlers/DatabaseHandler.hpp"
#include "cpanbridge/handlers/FtpHandler.hpp"
#include "cpanbridge/handlers/HttpHandler.hpp"
#include "cpanbridge/handlers/LockFileHandler.hpp"
#include "cpanbridge/handlers/LoggingHandler.hpp"
#include "cpanbridge/handlers/SystemHandler.hpp"
#include "cpanbridge/handlers/XmlDomHandler.hpp"
#include "cpanbridge/protocol/Message.hpp"
#include "cpanbridge/security/CapabilityRegistry.hpp"
#include "cpanbridge/security/Validator.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <utility>

namespace cpanbridge::test {

// The daemon's request path without the socket in front of it.
struct BridgeFixture {
    explicit BridgeFixture(Config settings = {})
        : config(std::move(settings)),
          pool(config.max_handles),
          metrics(config.metrics_window, config.health),
          validator(config.limits),
          reaper(pool, config),
          dispatcher(registry, validator, pool, metrics) {
        const handlers::SystemServices services{config, pool, metrics, reaper, registry, validator, [this] {
                                                    ++shutdown_requests;
                                                    return true;
                                                }};
        registry.add(std::make_shared<handlers::TestHandler>(services));
        registry.add(std::make_shared<handlers::SystemHandler>(services));
        registry.add(std::make_shared<handlers::DatabaseHandler>());
        registry.add(std::make_shared<handlers::CipherHandler>());
        registry.add(std::make_shared<handlers::HttpHandler>());
        registry.add(std::make_shared<handlers::FtpHandler>());
        registry.add(std::make_shared<handlers::XmlDomHandler>());
        registry.add(std::make_shared<handlers::XPathHandler>());
        registry.add(std::make_shared<handlers::XmlSimpleHandler>());
        registry.add(std::make_shared<handlers::LockFileHandler>());
        registry.add(std::make_shared<handlers::LoggingHandler>());
        registry.add(std::make_shared<handlers::DateTimeHandler>());
        registry.freeze();
    }

    protocol::Response call(const std::string& module, const std::string& function, Value params = Value(Json::objectValue)) {
        protocol::Request request;
        request.module = module;
        request.function = function;
        request.params = std::move(params);
        return dispatcher.dispatch(request, "pid:test");
    }

    // Result of a successful call, or null with the message kept in last_error.
    Value result_of(const std::string& module, const std::string& function, Value params = Value(Json::objectValue)) {
        auto response = call(module, function, std::move(params));
        if (!response.success) {
            last_error = response.error;
            return Value{};
        }
        return std::move(response.result);
    }

    Config config;
    HandlePool pool;
    MetricsCollector metrics;
    security::Validator validator;
    security::CapabilityRegistry registry;
    StaleReaper reaper;
    daemon::Dispatcher dispatcher;
    std::atomic<int> shutdown_requests{0};
    std::string last_error;
};

inline std::string text(const Value& object, const char* key) {
    const auto* member = find_member(object, key);
    return member && member->isString() ? member->asString() : std::string{};
}

inline std::int64_t integer(const Value& object, const char* key) {
    const auto* member = find_member(object, key);
    return member && is_integer(*member) ? member->asInt64() : -1;
}

inline bool flag(const Value& object, const char* key) {
    const auto* member = find_member(object, key);
    return member && member->isBool() && member->asBool();
}

}  // namespace cpanbridge::test
