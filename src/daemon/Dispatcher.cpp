#include "cpanbridge/daemon/Dispatcher.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <chrono>
#include <exception>
#include <new>
#include <utility>

namespace cpanbridge::daemon {

namespace {

// Denied requests carry client-chosen names, so they share one per-call entry.
const std::string kDeniedModule = "denied";
const std::string kDeniedFunction = "*";

}  // namespace

Dispatcher::Dispatcher(const security::CapabilityRegistry& registry,
                       const security::Validator& validator,
                       HandlePool& pool,
                       MetricsCollector& metrics)
    : registry_(registry), validator_(validator), pool_(pool), metrics_(metrics) {}

protocol::Response Dispatcher::dispatch(const protocol::Request& request, const std::string& owner) {
    const auto started = std::chrono::steady_clock::now();
    auto response = execute(request, owner);
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    if (!response.success && response.error_kind == ErrorKind::Authorization) {
        metrics_.record(kDeniedModule, kDeniedFunction, elapsed, false);
    } else {
        metrics_.record(request.module, request.function, elapsed, response.success);
    }

    if (response.success) {
        log_event(StructuredLogger::Level::Debug,
                  "dispatch.completed",
                  {{"module", request.module},
                   {"function", request.function},
                   {"duration_us", std::to_string(elapsed.count())}});
    }
    return response;
}

protocol::Response Dispatcher::execute(const protocol::Request& request, const std::string& owner) {
    using protocol::Response;

    const auto decision = registry_.authorize(request.module, request.function);
    if (!decision.allowed) {
        metrics_.record_rejected(decision.security_event.empty() ? "unauthorized_function" : decision.security_event);
        log_event(StructuredLogger::Level::Warning,
                  "dispatch.denied",
                  {{"module", request.module},
                   {"function", request.function},
                   {"owner", owner},
                   {"reason", decision.security_event}});
        return Response::failure(ErrorKind::Authorization, decision.reason);
    }

    if (const auto rejection = validator_.validate(request.params)) {
        metrics_.record_validation_failure();
        log_event(StructuredLogger::Level::Warning,
                  "dispatch.invalid",
                  {{"module", request.module},
                   {"function", request.function},
                   {"reason", *rejection}});
        return Response::failure(ErrorKind::Validation, "Validation failed: " + *rejection);
    }

    auto* handler = registry_.resolve(request.module);
    if (!handler) {
        return Response::failure(ErrorKind::Internal, "No handler registered for module " + request.module);
    }

    try {
        handlers::HandlerContext context(pool_, owner);
        auto result = handler->invoke(request.function, request.params, context);
        context.touch_acquired();
        return Response::ok(std::move(result));
    } catch (const BridgeError& ex) {
        log_event(ex.kind() == ErrorKind::Internal ? StructuredLogger::Level::Error : StructuredLogger::Level::Warning,
                  "dispatch.failed",
                  {{"module", request.module},
                   {"function", request.function},
                   {"error_type", std::string(error_kind_to_string(ex.kind()))},
                   {"message", ex.what()}});
        return Response::failure(ex.kind(), ex.what());
    } catch (const std::bad_alloc&) {
        log_event(StructuredLogger::Level::Error,
                  "dispatch.failed",
                  {{"module", request.module}, {"function", request.function}, {"error_type", "resource"}});
        return Response::failure(ErrorKind::Resource, "Out of memory while executing " + request.module + "." + request.function);
    } catch (const std::exception& ex) {
        log_event(StructuredLogger::Level::Warning,
                  "dispatch.failed",
                  {{"module", request.module},
                   {"function", request.function},
                   {"error_type", "execution"},
                   {"message", ex.what()}});
        return Response::failure(ErrorKind::Execution, ex.what());
    }
}

}  // namespace cpanbridge::daemon
