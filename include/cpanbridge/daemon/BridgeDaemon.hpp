#pragma once

#include "cpanbridge/Config.hpp"
#include "cpanbridge/core/HandlePool.hpp"
#include "cpanbridge/core/MetricsCollector.hpp"
#include "cpanbridge/core/StaleReaper.hpp"
#include "cpanbridge/daemon/Dispatcher.hpp"
#include "cpanbridge/daemon/TransportListener.hpp"
#include "cpanbridge/security/CapabilityRegistry.hpp"
#include "cpanbridge/security/Validator.hpp"

#include <functional>
#include <mutex>

namespace cpanbridge::daemon {

// Owns every daemon component; nothing here is a process-wide singleton.
class BridgeDaemon {
public:
    using ShutdownCallback = std::function<void()>;

    explicit BridgeDaemon(Config config);
    ~BridgeDaemon();

    BridgeDaemon(const BridgeDaemon&) = delete;
    BridgeDaemon& operator=(const BridgeDaemon&) = delete;

    // Registers the handlers, freezes the registry, then starts the reaper
    // and the listener. Throws std::runtime_error when the socket is taken.
    void start();

    // Idempotent. Must not be called from a request worker.
    void stop();

    [[nodiscard]] bool running() const noexcept;

    // Invoked (from a worker thread) when a client asks for system.shutdown.
    void set_shutdown_callback(ShutdownCallback callback);

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    HandlePool& pool() noexcept { return pool_; }
    MetricsCollector& metrics() noexcept { return metrics_; }
    StaleReaper& reaper() noexcept { return reaper_; }
    Dispatcher& dispatcher() noexcept { return dispatcher_; }
    const security::CapabilityRegistry& registry() const noexcept { return registry_; }

private:
    void register_handlers();
    bool request_shutdown();

    Config config_;
    HandlePool pool_;
    MetricsCollector metrics_;
    security::Validator validator_;
    security::CapabilityRegistry registry_;
    Dispatcher dispatcher_;
    StaleReaper reaper_;
    TransportListener listener_;

    std::mutex callback_mutex_;
    ShutdownCallback shutdown_callback_;
    bool started_{false};
};

}  // namespace cpanbridge::daemon
