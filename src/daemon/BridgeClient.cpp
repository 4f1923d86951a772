#include "cpanbridge/daemon/BridgeClient.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

namespace cpanbridge::daemon {

namespace {

using NativeSocket = int;
constexpr NativeSocket kInvalidSocket = -1;

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

bool recv_all(NativeSocket socket, std::string& data) {
    char buffer[16 * 1024];
    while (true) {
        const auto received = ::recv(socket, buffer, sizeof(buffer), 0);
        if (received == 0) {
            return true;
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.append(buffer, static_cast<std::size_t>(received));
    }
}

double unix_now() {
    timespec now{};
    ::clock_gettime(CLOCK_REALTIME, &now);
    return static_cast<double>(now.tv_sec) + static_cast<double>(now.tv_nsec) / 1e9;
}

}  // namespace

class BridgeClient::Impl {
public:
    Impl(std::string socket_path, std::chrono::milliseconds timeout)
        : socket_path_(std::move(socket_path)), timeout_(timeout) {}

    std::optional<std::string> send_raw(std::string_view payload) {
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        if (socket_path_.empty() || socket_path_.size() >= sizeof(addr.sun_path)) {
            return std::nullopt;
        }
        std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

        const auto socket = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (socket == kInvalidSocket) {
            return std::nullopt;
        }
        if (::connect(socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            close_socket(socket);
            return std::nullopt;
        }
        if (timeout_.count() > 0) {
            timeval tv{};
            tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
            ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            ::setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        std::string response;
        const bool sent = send_all(socket, payload.data(), payload.size()) && ::shutdown(socket, SHUT_WR) == 0;
        // A daemon that refuses the request may still have answered.
        const bool received = recv_all(socket, response);
        close_socket(socket);
        if (!sent && response.empty()) {
            return std::nullopt;
        }
        if (!received && response.empty()) {
            return std::string{};
        }
        return response;
    }

    std::optional<protocol::Response> send(const protocol::Request& request) {
        const auto raw = send_raw(protocol::encode_request(request));
        if (!raw) {
            return std::nullopt;
        }
        if (raw->empty()) {
            return protocol::Response::failure(ErrorKind::Transport, "Connection closed without a response");
        }
        try {
            return protocol::decode_response(*raw);
        } catch (const BridgeError& error) {
            return protocol::Response::failure(ErrorKind::Transport,
                                               std::string("Malformed response: ") + error.what());
        }
    }

private:
    std::string socket_path_;
    std::chrono::milliseconds timeout_;
};

BridgeClient::BridgeClient(std::string socket_path, std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>(std::move(socket_path), timeout)) {}

BridgeClient::~BridgeClient() = default;

std::optional<protocol::Response> BridgeClient::call(const std::string& module,
                                                     const std::string& function,
                                                     Value params) {
    protocol::Request request;
    request.module = module;
    request.function = function;
    request.params = std::move(params);
    request.timestamp = unix_now();
    return impl_->send(request);
}

std::optional<protocol::Response> BridgeClient::send(const protocol::Request& request) {
    return impl_->send(request);
}

std::optional<std::string> BridgeClient::send_raw(std::string_view payload) {
    return impl_->send_raw(payload);
}

bool BridgeClient::reachable() {
    const auto response = call("test", "ping");
    return response.has_value() && response->success;
}

}  // namespace cpanbridge::daemon
