#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

#include <memory>

namespace cpanbridge::handlers {

// "database" module: DBI-style connections and prepared statements over SQLite.
class DatabaseHandler final : public CapabilityHandler {
public:
    DatabaseHandler();
    ~DatabaseHandler() override;

    std::string_view module() const noexcept override { return "database"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpanbridge::handlers
