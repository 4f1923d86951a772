#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

#include <memory>

namespace cpanbridge::handlers {

// "lockfile" module: advisory lock files created atomically with O_EXCL.
class LockFileHandler final : public CapabilityHandler {
public:
    LockFileHandler();
    ~LockFileHandler() override;

    std::string_view module() const noexcept override { return "lockfile"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpanbridge::handlers
