#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

#include <memory>

namespace cpanbridge::handlers {

// "logging" module: Log4perl-style category loggers writing to a standard
// output appender named "sysout". Loggers are pooled handles.
class LoggingHandler final : public CapabilityHandler {
public:
    LoggingHandler();
    ~LoggingHandler() override;

    std::string_view module() const noexcept override { return "logging"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpanbridge::handlers
