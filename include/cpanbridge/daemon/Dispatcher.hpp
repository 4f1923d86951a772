#pragma once

#include "cpanbridge/core/HandlePool.hpp"
#include "cpanbridge/core/MetricsCollector.hpp"
#include "cpanbridge/protocol/Message.hpp"
#include "cpanbridge/security/CapabilityRegistry.hpp"
#include "cpanbridge/security/Validator.hpp"

#include <string>

namespace cpanbridge::daemon {

// Authorize -> validate -> execute -> record for one decoded request.
// Never throws: every failure becomes a structured Response.
class Dispatcher {
public:
    Dispatcher(const security::CapabilityRegistry& registry,
               const security::Validator& validator,
               HandlePool& pool,
               MetricsCollector& metrics);

    protocol::Response dispatch(const protocol::Request& request, const std::string& owner = {});

private:
    protocol::Response execute(const protocol::Request& request, const std::string& owner);

    const security::CapabilityRegistry& registry_;
    const security::Validator& validator_;
    HandlePool& pool_;
    MetricsCollector& metrics_;
};

}  // namespace cpanbridge::daemon
