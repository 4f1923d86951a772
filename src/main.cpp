#include "cpanbridge/Config.hpp"
#include "cpanbridge/Version.hpp"
#include "cpanbridge/core/ConfigLoader.hpp"
#include "cpanbridge/daemon/BridgeClient.hpp"
#include "cpanbridge/daemon/BridgeDaemon.hpp"
#include "cpanbridge/daemon/StructuredLogger.hpp"
#include "cpanbridge/protocol/Json.hpp"
#include "cpanbridge/protocol/Message.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <signal.h>

using namespace std::chrono_literals;

namespace {

using cpanbridge::Config;
using cpanbridge::ConfigError;
using cpanbridge::daemon::StructuredLogger;

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

constexpr std::string_view kUnreachableCode = "E_DAEMON_UNREACHABLE";
constexpr int kExitUnreachable = 2;

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

[[noreturn]] void throw_daemon_unreachable(const std::string& socket_path) {
    throw_cli_error(std::string(kUnreachableCode),
                    "Could not contact the daemon at " + socket_path + ".",
                    "Start it with 'cpanbridge serve' in another terminal, and verify --socket");
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

struct GlobalOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> socket_path;
    std::optional<std::size_t> max_connections;
    std::optional<std::chrono::seconds> reaper_period;
    std::optional<std::chrono::seconds> idle_threshold;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
};

std::uint64_t parse_unsigned_option(std::string_view option, const std::string& text) {
    std::uint64_t value{};
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        throw_cli_error("E_INVALID_VALUE",
                        std::string(option) + " expects a non-negative integer, got '" + text + "'",
                        "Pass a whole number such as 60");
    }
    return value;
}

Config resolve_config(const GlobalOptions& options) {
    Config config;
    if (options.config_path) {
        config = cpanbridge::load_config_file(*options.config_path, std::move(config));
    }
    config = cpanbridge::apply_environment(std::move(config));
    if (options.socket_path) {
        config.socket_path = *options.socket_path;
    }
    if (options.max_connections) {
        config.max_connections = *options.max_connections;
    }
    if (options.reaper_period) {
        config.reaper_period = *options.reaper_period;
    }
    if (options.idle_threshold) {
        config.idle_threshold = *options.idle_threshold;
    }
    if (options.log_level) {
        config.log_level = *options.log_level;
    }
    if (options.log_file) {
        config.log_file = *options.log_file;
    }
    cpanbridge::validate_config(config);
    return config;
}

void configure_logging(const Config& config) {
    auto& logger = StructuredLogger::instance();
    if (const auto level = StructuredLogger::level_from_string(config.log_level)) {
        logger.set_min_level(*level);
    }
    if (config.log_file && !logger.set_log_file(*config.log_file)) {
        throw_cli_error("E_LOG_FILE",
                        "Unable to open log file " + *config.log_file,
                        "Check that the directory exists and is writable");
    }
}

enum class ShutdownReason {
    None,
    Signal,
    Control
};

std::atomic<bool> g_run_loop{false};
std::atomic<ShutdownReason> g_shutdown_reason{ShutdownReason::None};

void request_shutdown(ShutdownReason reason) noexcept {
    g_shutdown_reason.store(reason, std::memory_order_release);
    g_run_loop.store(false, std::memory_order_release);
}

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
    case SIGQUIT:
        request_shutdown(ShutdownReason::Signal);
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
    install(SIGQUIT);
    std::signal(SIGPIPE, SIG_IGN);
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGQUIT, SIG_DFL);
}

void print_usage() {
    std::cout << "cpanbridge " << cpanbridge::kDaemonVersion << std::endl;
    std::cout << "Usage: cpanbridge [options] <command> [args]\n\n";
    std::cout << "Commands:\n"
              << "  serve                            Run the daemon in the foreground\n"
              << "  ping                             Check that the daemon answers\n"
              << "  call <module> <function> [json]  Send one request and print the response\n"
              << "  stop                             Ask the daemon to shut down\n\n";
    std::cout << "Options:\n"
              << "  --config <file>          Load configuration from a JSON file\n"
              << "  --socket <path>          Unix socket path (default /tmp/cpan_bridge.sock)\n"
              << "  --max-connections <n>    Concurrent exchange limit\n"
              << "  --reaper-period <sec>    Interval between stale handle sweeps\n"
              << "  --idle-threshold <sec>   Idle time after which a handle is reaped\n"
              << "  --log-level <level>      debug, info, warning or error\n"
              << "  --log-file <path>        Also append log lines to this file\n"
              << "  --version                Print the version and exit\n"
              << "  --help                   Print this help message\n\n";
    std::cout << "Environment:\n"
              << "  CPAN_BRIDGE_SOCKET, CPAN_BRIDGE_DEBUG, CPAN_BRIDGE_MAX_CONNECTIONS,\n"
              << "  CPAN_BRIDGE_MAX_REQUEST_SIZE, CPAN_BRIDGE_TIMEOUT, CPAN_BRIDGE_CLEANUP_INTERVAL\n\n";
    std::cout << "Exit codes: 0 success, 1 error, 2 daemon unreachable" << std::endl;
}

int print_response(const cpanbridge::protocol::Response& response) {
    std::cout << cpanbridge::protocol::encode_response(response) << std::endl;
    return response.success ? 0 : 1;
}

int run_serve(const Config& config) {
    configure_logging(config);
    cpanbridge::daemon::BridgeDaemon daemon(config);

    g_shutdown_reason.store(ShutdownReason::None, std::memory_order_release);
    g_run_loop.store(true, std::memory_order_release);
    daemon.set_shutdown_callback([] { request_shutdown(ShutdownReason::Control); });
    install_termination_handlers();

    try {
        daemon.start();
    } catch (const std::runtime_error& ex) {
        uninstall_termination_handlers();
        throw_cli_error("E_SOCKET_BUSY", ex.what(), "Stop the other daemon or pass a different --socket");
    }

    std::cout << "Daemon running. Socket at " << config.socket_path << std::endl;
    std::cout << "Press Ctrl+C or run 'cpanbridge stop' to exit." << std::endl;

    while (g_run_loop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(200ms);
    }

    const auto reason = g_shutdown_reason.exchange(ShutdownReason::None, std::memory_order_acq_rel);
    if (reason == ShutdownReason::Signal) {
        std::cout << "\nInterrupt received, shutting down..." << std::endl;
    } else if (reason == ShutdownReason::Control) {
        std::cout << "Shutdown requested by client, stopping..." << std::endl;
    }
    daemon.stop();
    uninstall_termination_handlers();
    std::cout << "Daemon stopped." << std::endl;
    return 0;
}

int run_client(const Config& config, const std::string& command, const std::vector<std::string>& rest) {
    cpanbridge::daemon::BridgeClient client(config.socket_path);

    std::optional<cpanbridge::protocol::Response> response;
    if (command == "ping") {
        response = client.call("test", "ping");
    } else if (command == "stop") {
        response = client.call("system", "shutdown");
    } else {
        if (rest.size() < 2 || rest.size() > 3) {
            throw_cli_error("E_USAGE",
                            "call expects <module> <function> [json-params]",
                            "Example: cpanbridge call test ping '{\"hello\":1}'");
        }
        cpanbridge::Value params(Json::objectValue);
        if (rest.size() == 3) {
            try {
                params = cpanbridge::protocol::parse_json(rest[2]);
            } catch (const cpanbridge::protocol::JsonParseError& ex) {
                throw_cli_error("E_INVALID_JSON",
                                std::string("Parameters are not valid JSON: ") + ex.what(),
                                "Quote the JSON object for your shell");
            }
        }
        response = client.call(rest[0], rest[1], std::move(params));
    }

    if (!response) {
        throw_daemon_unreachable(config.socket_path);
    }
    return print_response(*response);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        std::optional<std::string> command;
        std::vector<std::string> positional;

        while (index < args.size()) {
            const auto opt = args[index++];
            if (!opt.starts_with("--")) {
                if (!command) {
                    command = std::string(opt);
                } else {
                    positional.emplace_back(opt);
                }
                continue;
            }
            if (opt == "--help") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "cpanbridge " << cpanbridge::kDaemonVersion << std::endl;
                return 0;
            }
            if (opt == "--config") {
                if (options.config_path.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--socket") {
                options.socket_path = require_value(opt);
                continue;
            }
            if (opt == "--max-connections") {
                options.max_connections = static_cast<std::size_t>(parse_unsigned_option(opt, require_value(opt)));
                continue;
            }
            if (opt == "--reaper-period") {
                options.reaper_period = std::chrono::seconds(parse_unsigned_option(opt, require_value(opt)));
                continue;
            }
            if (opt == "--idle-threshold") {
                options.idle_threshold = std::chrono::seconds(parse_unsigned_option(opt, require_value(opt)));
                continue;
            }
            if (opt == "--log-level") {
                options.log_level = require_value(opt);
                continue;
            }
            if (opt == "--log-file") {
                options.log_file = require_value(opt);
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'cpanbridge --help' to see the supported options");
        }

        if (!command) {
            print_usage();
            return 1;
        }

        const auto config = resolve_config(options);
        if (*command == "serve") {
            if (!positional.empty()) {
                throw_cli_error("E_USAGE", "serve takes no arguments");
            }
            return run_serve(config);
        }
        if (*command == "ping" || *command == "stop" || *command == "call") {
            if (*command != "call" && !positional.empty()) {
                throw_cli_error("E_USAGE", *command + " takes no arguments");
            }
            return run_client(config, *command, positional);
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + *command,
                        "Run 'cpanbridge --help' to see the list of available commands");

    } catch (const CliException& ex) {
        print_cli_error(ex);
        return ex.code() == kUnreachableCode ? kExitUnreachable : 1;
    } catch (const ConfigError& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.hint.empty()) {
            std::cerr << "Hint: " << ex.hint << std::endl;
        }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
