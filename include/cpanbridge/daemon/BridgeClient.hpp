#pragma once

#include "cpanbridge/core/Value.hpp"
#include "cpanbridge/protocol/Message.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cpanbridge::daemon {

class BridgeClient {
public:
    explicit BridgeClient(std::string socket_path,
                          std::chrono::milliseconds timeout = std::chrono::minutes(6));
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    // std::nullopt means the daemon could not be reached.
    std::optional<protocol::Response> call(const std::string& module,
                                           const std::string& function,
                                           Value params = Value(Json::objectValue));
    std::optional<protocol::Response> send(const protocol::Request& request);

    // Writes |payload| as-is and returns whatever the daemon answered.
    std::optional<std::string> send_raw(std::string_view payload);

    [[nodiscard]] bool reachable();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpanbridge::daemon
