#include "cpanbridge/daemon/BridgeClient.hpp"
#include "cpanbridge/daemon/BridgeDaemon.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace cpanbridge;
using namespace cpanbridge::daemon;

namespace {

Config integration_config(const std::string& socket_path) {
    Config config;
    config.socket_path = socket_path;
    config.max_request_bytes = 4096;
    config.request_timeout = std::chrono::seconds(5);
    config.execution_timeout = std::chrono::seconds(10);
    return config;
}

std::string socket_name(const std::string& suffix) {
    return "/tmp/cpanbridge_it_" + std::to_string(::getpid()) + suffix + ".sock";
}

int connect_raw(const std::string& socket_path) {
    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_un address{};
    address.sun_family = AF_UNIX;
    socket_path.copy(address.sun_path, sizeof(address.sun_path) - 1);
    const int connected = ::connect(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address));
    assert(connected == 0);
    return fd;
}

// Retries while the previous exchange still holds the only connection slot.
protocol::Response call_when_free(BridgeClient& client,
                                  const std::string& module,
                                  const std::string& function,
                                  Value params = Value(Json::objectValue)) {
    for (int attempt = 0; attempt < 100; ++attempt) {
        auto response = client.call(module, function, params);
        assert(response.has_value());
        if (response->success || response->error_kind != ErrorKind::Resource) {
            return *response;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(false && "connection slot never freed");
    return protocol::Response::failure(ErrorKind::Resource, "unreachable");
}

// A client that keeps sending a byte every 300ms without finishing its
// request is dropped once request_timeout has elapsed in total.
void trickling_client_is_cut_off() {
    const auto socket_path = socket_name("_trickle");
    std::filesystem::remove(socket_path);
    auto config = integration_config(socket_path);
    config.request_timeout = std::chrono::seconds(1);
    BridgeDaemon daemon(config);
    daemon.start();

    const int fd = connect_raw(socket_path);
    const auto started = std::chrono::steady_clock::now();
    bool closed = false;
    while (!closed && std::chrono::steady_clock::now() - started < std::chrono::seconds(5)) {
        if (::send(fd, "{", 1, MSG_NOSIGNAL) < 0) {
            closed = true;
            break;
        }
        pollfd entry{};
        entry.fd = fd;
        entry.events = POLLIN;
        if (::poll(&entry, 1, 300) > 0) {
            char byte = 0;
            closed = ::recv(fd, &byte, 1, 0) <= 0;
        }
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ::close(fd);
    assert(closed);
    assert(elapsed < std::chrono::seconds(3));
    assert(daemon.metrics().connections().transport_errors >= 1);

    daemon.stop();
}

// A handler outliving execution_timeout loses its client but keeps its
// connection slot until it returns.
void execution_timeout_keeps_slot_reserved() {
    const auto socket_path = socket_name("_exec");
    std::filesystem::remove(socket_path);
    const auto target = std::filesystem::temp_directory_path() /
                        ("cpanbridge_it_lock_" + std::to_string(::getpid()));
    std::filesystem::remove(target.string() + ".lock");

    auto config = integration_config(socket_path);
    config.execution_timeout = std::chrono::seconds(1);
    config.max_connections = 1;
    BridgeDaemon daemon(config);
    daemon.start();
    BridgeClient client(socket_path, std::chrono::seconds(10));

    Value settings(Json::objectValue);
    settings["max_wait"] = Value(3);
    settings["delay"] = Value(1);
    const auto manager = call_when_free(client, "lockfile", "make", settings);
    assert(manager.success);

    Value target_params(Json::objectValue);
    target_params["manager_id"] = manager.result["manager_id"];
    target_params["filename"] = Value(target.string());
    const auto held = call_when_free(client, "lockfile", "trylock", target_params);
    assert(held.success);

    const auto started = std::chrono::steady_clock::now();
    const auto blocked = call_when_free(client, "lockfile", "lock", target_params);
    const auto waited = std::chrono::steady_clock::now() - started;
    assert(!blocked.success);
    assert(blocked.error_kind == ErrorKind::Transport);
    assert(blocked.error.find("without a response") != std::string::npos);
    assert(waited < std::chrono::milliseconds(2500));
    assert(daemon.metrics().connections().execution_timeouts == 1);

    const auto refused = client.call("test", "ping");
    assert(refused.has_value());
    assert(!refused->success);
    assert(refused->error_kind == ErrorKind::Resource);
    assert(refused->error.find("Too many concurrent connections") != std::string::npos);

    bool recovered = false;
    for (int i = 0; i < 60 && !recovered; ++i) {
        const auto pong = client.call("test", "ping");
        recovered = pong.has_value() && pong->success;
        if (!recovered) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
    assert(recovered);

    daemon.stop();
    std::filesystem::remove(target.string() + ".lock");
}

// An idle connection occupying the only slot turns the next client away.
void connection_limit_rejects_extra_clients() {
    const auto socket_path = socket_name("_limit");
    std::filesystem::remove(socket_path);
    auto config = integration_config(socket_path);
    config.max_connections = 1;
    BridgeDaemon daemon(config);
    daemon.start();

    const int idle = connect_raw(socket_path);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    BridgeClient client(socket_path, std::chrono::seconds(10));
    const auto refused = client.call("test", "ping");
    assert(refused.has_value());
    assert(!refused->success);
    assert(refused->error_kind == ErrorKind::Resource);
    assert(refused->error.find("Too many concurrent connections (limit 1)") != std::string::npos);
    assert(daemon.metrics().connections().rejected >= 1);

    ::close(idle);
    const auto pong = call_when_free(client, "test", "ping");
    assert(pong.success);

    daemon.stop();
}

// Stopping while the accept loop is blocked leaves nothing behind to restart.
void restart_cycles() {
    const auto socket_path = socket_name("_restart");
    std::filesystem::remove(socket_path);
    BridgeClient client(socket_path, std::chrono::seconds(10));
    for (int cycle = 0; cycle < 3; ++cycle) {
        BridgeDaemon daemon(integration_config(socket_path));
        daemon.start();
        const auto pong = client.call("test", "ping");
        assert(pong.has_value() && pong->success);
        daemon.stop();
        assert(!std::filesystem::exists(socket_path));
        assert(!client.call("test", "ping").has_value());
    }
}

}  // namespace

int main() {
    const std::string socket_path = socket_name("");
    std::filesystem::remove(socket_path);

    BridgeClient client(socket_path, std::chrono::seconds(10));
    assert(!client.reachable());
    assert(!client.call("test", "ping").has_value());

    BridgeDaemon daemon(integration_config(socket_path));
    std::atomic<bool> shutdown_requested{false};
    daemon.set_shutdown_callback([&] { shutdown_requested = true; });
    daemon.start();
    assert(daemon.running());
    assert(std::filesystem::exists(socket_path));
    assert(client.reachable());

    const auto pong = client.call("test", "ping");
    assert(pong.has_value());
    assert(pong->success);
    assert(pong->result["message"].asString() == "pong");

    // Concurrent clients are served independently.
    {
        std::atomic<int> answered{0};
        std::vector<std::thread> workers;
        for (int i = 0; i < 8; ++i) {
            workers.emplace_back([&, i] {
                BridgeClient local(socket_path, std::chrono::seconds(10));
                Value params(Json::objectValue);
                params["worker"] = Value(i);
                const auto echoed = local.call("test", "ping", params);
                if (!echoed || !echoed->success) {
                    return;
                }
                const auto* input = find_member(echoed->result, "input");
                const auto* worker = input ? find_member(*input, "worker") : nullptr;
                if (worker && is_integer(*worker) && worker->asInt64() == i) {
                    ++answered;
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        assert(answered == 8);
    }

    // Malformed documents get a transport error back.
    const auto garbage = client.send_raw("this is not json");
    assert(garbage.has_value());
    const auto decoded = protocol::decode_response(*garbage);
    assert(!decoded.success);
    assert(decoded.error_kind == ErrorKind::Transport);

    const auto incomplete = client.send_raw(R"({"module":"test"})");
    assert(incomplete.has_value());
    assert(protocol::decode_response(*incomplete).error_kind == ErrorKind::Transport);

    // Oversized requests are refused before decoding.
    Value bulky(Json::objectValue);
    bulky["blob"] = Value(std::string(8192, 'x'));
    const auto oversized = client.call("test", "ping", bulky);
    assert(oversized.has_value());
    assert(!oversized->success);
    assert(oversized->error_kind == ErrorKind::Transport);
    assert(oversized->error.find("exceeds maximum size") != std::string::npos);

    // Handler errors travel back as regular responses.
    const auto denied = client.call("database", "malicious_function");
    assert(denied.has_value());
    assert(!denied->success);
    assert(denied->error_kind == ErrorKind::Authorization);

    // A live daemon keeps its socket.
    {
        BridgeDaemon second(integration_config(socket_path));
        bool refused = false;
        try {
            second.start();
        } catch (const std::runtime_error&) {
            refused = true;
        }
        assert(refused);
        assert(client.reachable());
    }

    const auto metrics = client.call("system", "metrics");
    assert(metrics.has_value() && metrics->success);
    assert(daemon.metrics().snapshot().total_requests >= 10);

    const auto shutdown = client.call("system", "shutdown");
    assert(shutdown.has_value());
    assert(shutdown->success);
    for (int i = 0; i < 50 && !shutdown_requested; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(shutdown_requested);

    daemon.stop();
    assert(!daemon.running());
    assert(!std::filesystem::exists(socket_path));
    assert(!client.call("test", "ping").has_value());
    daemon.stop();

    restart_cycles();
    trickling_client_is_cut_off();
    execution_timeout_keeps_slot_reserved();
    connection_limit_rejects_extra_clients();

    return 0;
}
