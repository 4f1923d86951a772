#include "cpanbridge/daemon/TransportListener.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"
#include "cpanbridge/protocol/Message.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <climits>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

namespace cpanbridge::daemon {

namespace {

using NativeSocket = int;
constexpr NativeSocket kInvalidSocket = -1;
constexpr std::size_t kReadChunk = 64 * 1024;

void close_socket(NativeSocket socket) {
    if (socket != kInvalidSocket) {
        ::close(socket);
    }
}

bool send_all(NativeSocket socket, const char* data, std::size_t length) {
    std::size_t total_sent = 0;
    while (total_sent < length) {
        const auto sent = ::send(socket, data + total_sent, length - total_sent, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    return true;
}

void set_timeout(NativeSocket socket, int option, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return;
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(socket, SOL_SOCKET, option, &tv, sizeof(tv));
}

sockaddr_un make_address(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("Invalid socket path: " + path);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

// True when something accepts connections on |path|.
bool socket_in_use(const std::string& path) {
    const NativeSocket peer = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (peer == kInvalidSocket) {
        return false;
    }
    const auto addr = make_address(path);
    const bool connected = ::connect(peer, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
    close_socket(peer);
    return connected;
}

std::string peer_owner(NativeSocket socket) {
    ucred credentials{};
    socklen_t length = sizeof(credentials);
    if (::getsockopt(socket, SOL_SOCKET, SO_PEERCRED, &credentials, &length) != 0 || credentials.pid <= 0) {
        return "unknown";
    }
    return "pid:" + std::to_string(credentials.pid);
}

enum class ReadStatus {
    Complete,
    TooLarge,
    TimedOut,
    Failed
};

// Reads until the client half-closes its side. |deadline| bounds the whole
// request, not each recv, so a client trickling bytes is still cut off.
ReadStatus read_request(NativeSocket socket,
                        std::size_t limit,
                        std::chrono::steady_clock::time_point deadline,
                        std::string& payload) {
    char buffer[kReadChunk];
    while (true) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ReadStatus::TimedOut;
        }
        pollfd entry{};
        entry.fd = socket;
        entry.events = POLLIN;
        const auto wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), INT_MAX));
        const int ready = ::poll(&entry, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ReadStatus::Failed;
        }
        if (ready == 0) {
            return ReadStatus::TimedOut;
        }

        const auto received = ::recv(socket, buffer, sizeof(buffer), 0);
        if (received == 0) {
            return ReadStatus::Complete;
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return ReadStatus::TimedOut;
            }
            return ReadStatus::Failed;
        }
        if (payload.size() + static_cast<std::size_t>(received) > limit) {
            return ReadStatus::TooLarge;
        }
        payload.append(buffer, static_cast<std::size_t>(received));
    }
}

}  // namespace

class TransportListener::Impl {
public:
    Impl(const Config& config, Dispatcher& dispatcher, MetricsCollector& metrics)
        : config_(config), dispatcher_(dispatcher), metrics_(metrics) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        const auto addr = make_address(config_.socket_path);
        if (::access(config_.socket_path.c_str(), F_OK) == 0) {
            if (socket_in_use(config_.socket_path)) {
                throw std::runtime_error("Another daemon is already listening on " + config_.socket_path);
            }
            ::unlink(config_.socket_path.c_str());
        }

        NativeSocket server = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (server == kInvalidSocket) {
            throw std::runtime_error("Failed to create transport socket");
        }
        if (::bind(server, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            const std::string reason = std::strerror(errno);
            close_socket(server);
            throw std::runtime_error("Failed to bind " + config_.socket_path + ": " + reason);
        }
        ::chmod(config_.socket_path.c_str(), S_IRUSR | S_IWUSR);
        if (::listen(server, SOMAXCONN) < 0) {
            close_socket(server);
            ::unlink(config_.socket_path.c_str());
            throw std::runtime_error("Failed to listen on " + config_.socket_path);
        }

        listen_socket_ = server;
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread(&Impl::accept_loop, this, server);
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        // shutdown() wakes the blocked accept; the descriptor is closed only
        // once the accept thread is gone so its number cannot be reused under it.
        if (listen_socket_ != kInvalidSocket) {
            ::shutdown(listen_socket_, SHUT_RDWR);
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        close_socket(listen_socket_);
        listen_socket_ = kInvalidSocket;
        {
            std::unique_lock lock(flight_mutex_);
            flight_cv_.wait(lock, [this] { return workers_ == 0; });
        }
        ::unlink(config_.socket_path.c_str());
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::size_t in_flight() const {
        std::scoped_lock lock(flight_mutex_);
        return workers_;
    }

    const std::string& socket_path() const noexcept {
        return config_.socket_path;
    }

private:
    Config config_;
    Dispatcher& dispatcher_;
    MetricsCollector& metrics_;
    std::atomic<bool> running_{false};
    NativeSocket listen_socket_{kInvalidSocket};
    std::thread accept_thread_;

    mutable std::mutex flight_mutex_;
    std::condition_variable flight_cv_;
    std::size_t workers_{0};
    std::size_t exchanges_{0};

    // One max_connections slot. It is shared by the connection thread and the
    // dispatch thread and returns to the pool when the last of them finishes.
    class ExchangeSlot {
    public:
        explicit ExchangeSlot(Impl& owner) : owner_(owner) {}
        ~ExchangeSlot() { owner_.release_exchange(); }

        ExchangeSlot(const ExchangeSlot&) = delete;
        ExchangeSlot& operator=(const ExchangeSlot&) = delete;

    private:
        Impl& owner_;
    };

    using SlotPtr = std::shared_ptr<ExchangeSlot>;

    void accept_loop(NativeSocket server) {
        while (running_.load(std::memory_order_acquire)) {
            const auto client = ::accept4(server, nullptr, nullptr, SOCK_CLOEXEC);
            if (client == kInvalidSocket) {
                if (running_.load(std::memory_order_acquire) && errno != EINTR) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }
            if (!reserve_exchange()) {
                reject(client);
                continue;
            }
            auto slot = std::make_shared<ExchangeSlot>(*this);
            try {
                spawn([this, client, slot] { serve(client, slot); });
            } catch (const std::system_error& error) {
                metrics_.connection_rejected();
                log_event(StructuredLogger::Level::Error,
                          "transport.connection.rejected",
                          {{"reason", "thread"}, {"error", error.what()}});
                close_socket(client);
            }
        }
    }

    bool reserve_exchange() {
        std::scoped_lock lock(flight_mutex_);
        if (exchanges_ >= config_.max_connections) {
            return false;
        }
        ++exchanges_;
        return true;
    }

    void release_exchange() {
        std::scoped_lock lock(flight_mutex_);
        --exchanges_;
    }

    // Runs |work| on a detached thread counted by stop(). The callable and
    // its captures are destroyed before the thread stops being counted.
    void spawn(std::function<void()> work) {
        {
            std::scoped_lock lock(flight_mutex_);
            ++workers_;
        }
        try {
            std::thread([this, work = std::move(work)]() mutable {
                work();
                work = nullptr;
                std::scoped_lock lock(flight_mutex_);
                --workers_;
                flight_cv_.notify_all();
            }).detach();
        } catch (...) {
            std::scoped_lock lock(flight_mutex_);
            --workers_;
            flight_cv_.notify_all();
            throw;
        }
    }

    void reject(NativeSocket client) {
        metrics_.connection_rejected();
        log_event(StructuredLogger::Level::Warning,
                  "transport.connection.rejected",
                  {{"reason", "max_connections"}, {"limit", std::to_string(config_.max_connections)}});
        set_timeout(client, SO_SNDTIMEO, std::chrono::seconds(1));
        respond(client,
                protocol::Response::failure(ErrorKind::Resource,
                                            "Too many concurrent connections (limit " +
                                                std::to_string(config_.max_connections) + ")"));
        close_socket(client);
    }

    void respond(NativeSocket client, const protocol::Response& response) {
        const auto encoded = protocol::encode_response(response);
        if (!send_all(client, encoded.data(), encoded.size())) {
            metrics_.transport_error();
            log_event(StructuredLogger::Level::Warning,
                      "transport.response.failed",
                      {{"error", std::strerror(errno)}});
        }
    }

    void serve(NativeSocket client, const SlotPtr& slot) {
        metrics_.connection_opened();
        exchange(client, slot);
        close_socket(client);
        metrics_.connection_closed();
    }

    void exchange(NativeSocket client, const SlotPtr& slot) {
        const auto deadline = std::chrono::steady_clock::now() + config_.request_timeout;
        set_timeout(client, SO_RCVTIMEO, config_.request_timeout);
        set_timeout(client, SO_SNDTIMEO, config_.request_timeout);
        const auto owner = peer_owner(client);
        log_event(StructuredLogger::Level::Info, "transport.connection.accepted", {{"peer", owner}});

        std::string payload;
        switch (read_request(client, config_.max_request_bytes, deadline, payload)) {
            case ReadStatus::Complete:
                break;
            case ReadStatus::TooLarge:
                metrics_.transport_error();
                log_event(StructuredLogger::Level::Warning,
                          "transport.request.parse_error",
                          {{"peer", owner}, {"reason", "too_large"}});
                respond(client,
                        protocol::Response::failure(ErrorKind::Transport,
                                                    "Request exceeds maximum size of " +
                                                        std::to_string(config_.max_request_bytes) + " bytes"));
                return;
            case ReadStatus::TimedOut:
                metrics_.transport_error();
                log_event(StructuredLogger::Level::Warning,
                          "transport.request.timeout",
                          {{"peer", owner}, {"phase", "read"}});
                return;
            case ReadStatus::Failed:
                metrics_.transport_error();
                log_event(StructuredLogger::Level::Warning,
                          "transport.request.parse_error",
                          {{"peer", owner}, {"reason", std::strerror(errno)}});
                return;
        }

        protocol::Request request;
        try {
            request = protocol::decode_request(payload);
        } catch (const BridgeError& error) {
            metrics_.transport_error();
            log_event(StructuredLogger::Level::Warning,
                      "transport.request.parse_error",
                      {{"peer", owner}, {"error", error.what()}});
            respond(client, protocol::Response::failure(error.kind(), error.what()));
            return;
        }

        auto outcome = std::make_shared<std::promise<protocol::Response>>();
        auto future = outcome->get_future();
        try {
            // The slot stays reserved while the handler runs, even after the
            // client has been dropped for exceeding execution_timeout.
            spawn([this, outcome, request, owner, slot] {
                outcome->set_value(dispatcher_.dispatch(request, owner));
            });
        } catch (const std::system_error& error) {
            respond(client, protocol::Response::failure(ErrorKind::Resource,
                                                        std::string("Unable to schedule request: ") + error.what()));
            return;
        }

        if (future.wait_for(config_.execution_timeout) == std::future_status::timeout) {
            metrics_.execution_timeout();
            log_event(StructuredLogger::Level::Warning,
                      "transport.request.timeout",
                      {{"peer", owner},
                       {"phase", "execution"},
                       {"module", request.module},
                       {"function", request.function}});
            return;
        }
        respond(client, future.get());
    }
};

TransportListener::TransportListener(const Config& config, Dispatcher& dispatcher, MetricsCollector& metrics)
    : impl_(std::make_unique<Impl>(config, dispatcher, metrics)) {}

TransportListener::~TransportListener() = default;

void TransportListener::start() {
    impl_->start();
}

void TransportListener::stop() {
    impl_->stop();
}

bool TransportListener::running() const noexcept {
    return impl_->running();
}

std::size_t TransportListener::in_flight() const {
    return impl_->in_flight();
}

const std::string& TransportListener::socket_path() const noexcept {
    return impl_->socket_path();
}

}  // namespace cpanbridge::daemon
