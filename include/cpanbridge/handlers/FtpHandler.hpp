#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

#include <memory>

namespace cpanbridge::handlers {

// "ftp" module: Net::FTP-style sessions. Each ftp_session handle keeps one
// libcurl easy handle so the control connection is reused across calls.
class FtpHandler final : public CapabilityHandler {
public:
    FtpHandler();
    ~FtpHandler() override;

    std::string_view module() const noexcept override { return "ftp"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpanbridge::handlers
