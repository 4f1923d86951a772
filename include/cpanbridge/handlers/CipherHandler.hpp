#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

#include <memory>

namespace cpanbridge::handlers {

// "crypto" module: symmetric CBC ciphers backed by OpenSSL EVP.
class CipherHandler final : public CapabilityHandler {
public:
    CipherHandler();
    ~CipherHandler() override;

    std::string_view module() const noexcept override { return "crypto"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

    // Algorithms usable with the linked OpenSSL ("Blowfish", "AES").
    static std::vector<std::string> supported_algorithms();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpanbridge::handlers
