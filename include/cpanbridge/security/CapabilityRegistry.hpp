#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cpanbridge::security {

struct AuthorizationDecision {
    bool allowed{false};
    std::string reason;
    // Non-empty when the denial looked like a probing attempt rather than a typo.
    std::string security_event;
};

// Closed-world map of (module, function) to handler. Populated at startup,
// frozen, then read concurrently without locking.
class CapabilityRegistry {
public:
    CapabilityRegistry() = default;

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    void add(handlers::CapabilityHandlerPtr handler);

    // Keeps only the listed functions of each listed module; unlisted modules are dropped.
    void restrict_to(const std::map<std::string, std::vector<std::string>>& whitelist);

    void freeze() noexcept { frozen_ = true; }
    [[nodiscard]] bool frozen() const noexcept { return frozen_; }

    [[nodiscard]] AuthorizationDecision authorize(std::string_view module, std::string_view function) const;

    // Handler serving |module|, or nullptr.
    [[nodiscard]] handlers::CapabilityHandler* resolve(std::string_view module) const;

    [[nodiscard]] std::vector<std::string> modules() const;
    [[nodiscard]] std::map<std::string, std::vector<std::string>> capabilities() const;

    static bool is_valid_name(std::string_view name) noexcept;

private:
    struct Entry {
        handlers::CapabilityHandlerPtr handler;
        std::set<std::string, std::less<>> functions;
    };

    void ensure_mutable() const;

    std::map<std::string, Entry, std::less<>> entries_;
    bool frozen_{false};
};

}  // namespace cpanbridge::security
