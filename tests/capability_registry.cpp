#include "cpanbridge/security/CapabilityRegistry.hpp"

#include <cassert>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>

using namespace cpanbridge;
using cpanbridge::security::CapabilityRegistry;

namespace {

class FixedHandler final : public handlers::CapabilityHandler {
public:
    FixedHandler(std::string module, std::vector<std::string> functions)
        : module_(std::move(module)), functions_(std::move(functions)) {}

    std::string_view module() const noexcept override { return module_; }
    std::vector<std::string> functions() const override { return functions_; }
    Value invoke(const std::string& function, const Value&, handlers::HandlerContext&) override {
        return Value(function);
    }

private:
    std::string module_;
    std::vector<std::string> functions_;
};

bool denied_as_unauthorized(const CapabilityRegistry& registry, std::string_view module, std::string_view function) {
    const auto decision = registry.authorize(module, function);
    static const std::regex pattern("not allowed|unauthorized", std::regex::icase);
    return !decision.allowed && std::regex_search(decision.reason, pattern);
}

}  // namespace

int main() {
    CapabilityRegistry registry;
    registry.add(std::make_shared<FixedHandler>("test", std::vector<std::string>{"ping", "health", "stats"}));
    registry.add(std::make_shared<FixedHandler>("database", std::vector<std::string>{"connect", "prepare", "disconnect"}));
    registry.add(std::make_shared<FixedHandler>("crypto", std::vector<std::string>{"new", "encrypt"}));

    bool duplicate_rejected = false;
    try {
        registry.add(std::make_shared<FixedHandler>("crypto", std::vector<std::string>{"decrypt"}));
    } catch (const std::invalid_argument&) {
        duplicate_rejected = true;
    }
    assert(duplicate_rejected);

    assert(registry.authorize("database", "connect").allowed);
    assert(registry.resolve("database") != nullptr);
    assert(registry.resolve("nothing") == nullptr);

    assert(denied_as_unauthorized(registry, "database", "malicious_function"));
    assert(denied_as_unauthorized(registry, "nothing", "connect"));
    assert(denied_as_unauthorized(registry, "database", "connect;rm"));
    assert(denied_as_unauthorized(registry, "database", ""));

    const auto dangerous = registry.authorize("database", "__init__");
    assert(!dangerous.allowed);
    assert(dangerous.security_event == "dangerous_name");
    assert(registry.authorize("crypto", "eval_key").security_event == "dangerous_name");
    assert(registry.authorize("database", "system").security_event == "dangerous_name");
    assert(registry.authorize("database", "malicious_function").security_event == "unauthorized_function");
    assert(registry.authorize("data-base", "connect").security_event == "invalid_name");

    // The whitelist narrows; test.ping survives even when omitted.
    registry.restrict_to({{"database", {"connect", "nonexistent"}}});
    registry.freeze();
    assert(registry.frozen());
    assert(registry.authorize("database", "connect").allowed);
    assert(!registry.authorize("database", "prepare").allowed);
    assert(!registry.authorize("database", "nonexistent").allowed);
    assert(!registry.authorize("crypto", "new").allowed);
    assert(registry.authorize("test", "ping").allowed);
    assert(!registry.authorize("test", "health").allowed);

    const auto capabilities = registry.capabilities();
    assert(capabilities.size() == 2);
    assert(capabilities.at("database") == std::vector<std::string>{"connect"});

    bool frozen_rejected = false;
    try {
        registry.add(std::make_shared<FixedHandler>("http", std::vector<std::string>{"get"}));
    } catch (const std::logic_error&) {
        frozen_rejected = true;
    }
    assert(frozen_rejected);

    return 0;
}
