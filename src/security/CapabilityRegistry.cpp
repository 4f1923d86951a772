#include "cpanbridge/security/CapabilityRegistry.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

namespace cpanbridge::security {

namespace {

constexpr std::array<std::string_view, 4> kDangerousFragments{"__", "eval", "import", "subprocess"};
constexpr std::array<std::string_view, 4> kDangerousFunctions{"exec", "open", "file", "system"};

std::string lower_copy(std::string_view text) {
    std::string lowered(text);
    for (auto& ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return lowered;
}

bool looks_dangerous(std::string_view module, std::string_view function) {
    const auto lowered_module = lower_copy(module);
    const auto lowered_function = lower_copy(function);
    for (const auto fragment : kDangerousFragments) {
        if (lowered_module.find(fragment) != std::string::npos || lowered_function.find(fragment) != std::string::npos) {
            return true;
        }
    }
    for (const auto name : kDangerousFunctions) {
        if (lowered_function == name) {
            return true;
        }
    }
    return false;
}

std::string denial(std::string_view module, std::string_view function) {
    return "Function " + std::string(module) + "." + std::string(function) +
           " is not allowed (unauthorized capability)";
}

}  // namespace

void CapabilityRegistry::ensure_mutable() const {
    if (frozen_) {
        throw std::logic_error("Capability registry is frozen");
    }
}

void CapabilityRegistry::add(handlers::CapabilityHandlerPtr handler) {
    ensure_mutable();
    if (!handler) {
        throw std::invalid_argument("Cannot register a null capability handler");
    }
    const std::string module(handler->module());
    if (!is_valid_name(module)) {
        throw std::invalid_argument("Invalid module name: " + module);
    }
    if (entries_.count(module) > 0) {
        throw std::invalid_argument("Module registered twice: " + module);
    }

    Entry entry;
    for (auto& function : handler->functions()) {
        if (!is_valid_name(function)) {
            throw std::invalid_argument("Invalid function name: " + module + "." + function);
        }
        entry.functions.insert(std::move(function));
    }
    entry.handler = std::move(handler);
    entries_.emplace(module, std::move(entry));
}

void CapabilityRegistry::restrict_to(const std::map<std::string, std::vector<std::string>>& whitelist) {
    ensure_mutable();
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto allowed = whitelist.find(it->first);
        if (allowed == whitelist.end()) {
            // test.ping stays reachable even when the whitelist omits the test module.
            if (it->first == "test") {
                it->second.functions = {"ping"};
                ++it;
                continue;
            }
            it = entries_.erase(it);
            continue;
        }
        std::set<std::string, std::less<>> kept;
        for (const auto& function : allowed->second) {
            if (it->second.functions.count(function) > 0) {
                kept.insert(function);
            }
        }
        if (it->first == "test" && it->second.functions.count("ping") > 0) {
            kept.insert("ping");
        }
        it->second.functions = std::move(kept);
        ++it;
    }
}

AuthorizationDecision CapabilityRegistry::authorize(std::string_view module, std::string_view function) const {
    AuthorizationDecision decision;
    if (!is_valid_name(module) || !is_valid_name(function)) {
        decision.reason = denial(module, function) + ": names must be alphanumeric";
        decision.security_event = "invalid_name";
        return decision;
    }
    if (looks_dangerous(module, function)) {
        decision.reason = denial(module, function) + ": potentially dangerous name";
        decision.security_event = "dangerous_name";
        return decision;
    }

    const auto entry = entries_.find(module);
    if (entry == entries_.end() || entry->second.functions.count(function) == 0) {
        decision.reason = denial(module, function);
        decision.security_event = "unauthorized_function";
        return decision;
    }
    decision.allowed = true;
    return decision;
}

handlers::CapabilityHandler* CapabilityRegistry::resolve(std::string_view module) const {
    const auto entry = entries_.find(module);
    return entry == entries_.end() ? nullptr : entry->second.handler.get();
}

std::vector<std::string> CapabilityRegistry::modules() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    return names;
}

std::map<std::string, std::vector<std::string>> CapabilityRegistry::capabilities() const {
    std::map<std::string, std::vector<std::string>> result;
    for (const auto& [name, entry] : entries_) {
        result[name].assign(entry.functions.begin(), entry.functions.end());
    }
    return result;
}

bool CapabilityRegistry::is_valid_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > 128) {
        return false;
    }
    for (const char ch : name) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
            return false;
        }
    }
    return true;
}

}  // namespace cpanbridge::security
