#include "cpanbridge/daemon/BridgeDaemon.hpp"

#include "cpanbridge/Version.hpp"
#include "cpanbridge/daemon/StructuredLogger.hpp"
#include "cpanbridge/handlers/CipherHandler.hpp"
#include "cpanbridge/handlers/DatabaseHandler.hpp"
#include "cpanbridge/handlers/FtpHandler.hpp"
#include "cpanbridge/handlers/HttpHandler.hpp"
#include "cpanbridge/handlers/LockFileHandler.hpp"
#include "cpanbridge/handlers/LoggingHandler.hpp"
#include "cpanbridge/handlers/SystemHandler.hpp"
#include "cpanbridge/handlers/XmlDomHandler.hpp"

#include <memory>
#include <string>
#include <utility>

namespace cpanbridge::daemon {

BridgeDaemon::BridgeDaemon(Config config)
    : config_(std::move(config)),
      pool_(config_.max_handles),
      metrics_(config_.metrics_window, config_.health),
      validator_(config_.limits),
      dispatcher_(registry_, validator_, pool_, metrics_),
      reaper_(pool_, config_),
      listener_(config_, dispatcher_, metrics_) {}

BridgeDaemon::~BridgeDaemon() {
    stop();
}

void BridgeDaemon::register_handlers() {
    handlers::SystemServices services{config_,
                                      pool_,
                                      metrics_,
                                      reaper_,
                                      registry_,
                                      validator_,
                                      [this] { return request_shutdown(); }};
    registry_.add(std::make_shared<handlers::TestHandler>(services));
    registry_.add(std::make_shared<handlers::SystemHandler>(services));
    registry_.add(std::make_shared<handlers::DatabaseHandler>());
    registry_.add(std::make_shared<handlers::CipherHandler>());
    registry_.add(std::make_shared<handlers::HttpHandler>());
    registry_.add(std::make_shared<handlers::FtpHandler>());
    registry_.add(std::make_shared<handlers::XmlDomHandler>());
    registry_.add(std::make_shared<handlers::XPathHandler>());
    registry_.add(std::make_shared<handlers::XmlSimpleHandler>());
    registry_.add(std::make_shared<handlers::LockFileHandler>());
    registry_.add(std::make_shared<handlers::LoggingHandler>());
    registry_.add(std::make_shared<handlers::DateTimeHandler>());
    if (config_.whitelist) {
        registry_.restrict_to(*config_.whitelist);
    }
    registry_.freeze();
}

void BridgeDaemon::start() {
    if (started_) {
        return;
    }
    if (!registry_.frozen()) {
        register_handlers();
    }
    reaper_.start();
    try {
        listener_.start();
    } catch (...) {
        reaper_.stop();
        throw;
    }
    started_ = true;

    std::string modules;
    for (const auto& module : registry_.modules()) {
        modules += (modules.empty() ? "" : ",") + module;
    }
    log_event(StructuredLogger::Level::Info,
              "daemon.start",
              {{"version", std::string(kDaemonVersion)},
               {"socket", config_.socket_path},
               {"max_connections", std::to_string(config_.max_connections)},
               {"modules", modules}});
}

void BridgeDaemon::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    listener_.stop();
    reaper_.stop();
    const auto released = pool_.size();
    pool_.clear();
    log_event(StructuredLogger::Level::Info,
              "daemon.stop",
              {{"handles_released", std::to_string(released)},
               {"requests", std::to_string(metrics_.snapshot().total_requests)}});
}

bool BridgeDaemon::running() const noexcept {
    return started_ && listener_.running();
}

void BridgeDaemon::set_shutdown_callback(ShutdownCallback callback) {
    std::scoped_lock lock(callback_mutex_);
    shutdown_callback_ = std::move(callback);
}

bool BridgeDaemon::request_shutdown() {
    std::scoped_lock lock(callback_mutex_);
    if (!shutdown_callback_) {
        return false;
    }
    shutdown_callback_();
    return true;
}

}  // namespace cpanbridge::daemon
