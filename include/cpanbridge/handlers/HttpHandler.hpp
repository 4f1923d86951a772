#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

namespace cpanbridge::handlers {

// "http" module: LWP-style requests through libcurl. Stateless; no handles.
class HttpHandler final : public CapabilityHandler {
public:
    std::string_view module() const noexcept override { return "http"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

    // Standard reason phrase for |status|, "Unknown" when unlisted.
    static std::string reason_phrase(long status);
};

}  // namespace cpanbridge::handlers
