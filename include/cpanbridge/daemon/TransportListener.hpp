#pragma once

#include "cpanbridge/Config.hpp"
#include "cpanbridge/core/MetricsCollector.hpp"
#include "cpanbridge/daemon/Dispatcher.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace cpanbridge::daemon {

// Unix domain socket front end: one request per connection, framed by the
// client half-closing its write side, answered with one response.
class TransportListener {
public:
    TransportListener(const Config& config, Dispatcher& dispatcher, MetricsCollector& metrics);
    ~TransportListener();

    TransportListener(const TransportListener&) = delete;
    TransportListener& operator=(const TransportListener&) = delete;

    // Throws std::runtime_error when the socket cannot be bound or another
    // daemon already answers on the path.
    void start();

    // Stops accepting, waits for in-flight exchanges and removes the socket file.
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::size_t in_flight() const;
    [[nodiscard]] const std::string& socket_path() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cpanbridge::daemon
