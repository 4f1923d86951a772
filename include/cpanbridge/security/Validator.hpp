#pragma once

#include "cpanbridge/Config.hpp"
#include "cpanbridge/core/Value.hpp"

#include <optional>
#include <string>

namespace cpanbridge::security {

// Structural limits on request parameters. Stateless and thread-safe.
class Validator {
public:
    explicit Validator(ValidationLimits limits = {}) : limits_(limits) {}

    // Returns the rejection reason, or std::nullopt when |params| is acceptable.
    [[nodiscard]] std::optional<std::string> validate(const Value& params) const;

    [[nodiscard]] const ValidationLimits& limits() const noexcept { return limits_; }

private:
    ValidationLimits limits_;
};

}  // namespace cpanbridge::security
