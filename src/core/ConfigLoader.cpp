#include "cpanbridge/core/ConfigLoader.hpp"

#include "cpanbridge/protocol/Json.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace cpanbridge {

namespace {

std::optional<std::string> default_lookup(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

std::uint64_t require_unsigned(const Value& value, const std::string& key) {
    if (is_integer(value) && value.isUInt64()) {
        return value.asUInt64();
    }
    if (value.type() == Json::realValue && value.asDouble() >= 0.0 && value.asDouble() < 1.8e19) {
        return static_cast<std::uint64_t>(value.asDouble());
    }
    throw ConfigError("E_CONFIG_TYPE",
                      "Configuration key '" + key + "' must be a non-negative number",
                      "Use a plain integer such as 30");
}

std::string require_string_value(const Value& value, const std::string& key) {
    if (!value.isString()) {
        throw ConfigError("E_CONFIG_TYPE",
                          "Configuration key '" + key + "' must be a string");
    }
    return value.asString();
}

std::uint64_t parse_env_unsigned(const std::string& name, const std::string& text) {
    std::uint64_t value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        throw ConfigError("E_CONFIG_ENV",
                          "Environment variable " + name + " must be a non-negative integer",
                          "Current value: '" + text + "'");
    }
    return value;
}

void require_object(const Value& node, const std::string& key) {
    if (!node.isObject()) {
        throw ConfigError("E_CONFIG_TYPE", "Configuration key '" + key + "' must be an object");
    }
}

void apply_limits(const Value& node, ValidationLimits& limits) {
    require_object(node, "limits");
    for (const auto& key : node.getMemberNames()) {
        const auto& value = node[key];
        if (key == "max_string_length") {
            limits.max_string_length = require_unsigned(value, "limits." + key);
        } else if (key == "max_array_length") {
            limits.max_array_length = require_unsigned(value, "limits." + key);
        } else if (key == "max_object_depth") {
            limits.max_object_depth = require_unsigned(value, "limits." + key);
        } else if (key == "max_param_count") {
            limits.max_param_count = require_unsigned(value, "limits." + key);
        } else {
            throw ConfigError("E_CONFIG_UNKNOWN_KEY", "Unknown configuration key 'limits." + key + "'");
        }
    }
}

void apply_health(const Value& node, HealthThresholds& health) {
    require_object(node, "health");
    for (const auto& key : node.getMemberNames()) {
        const auto& value = node[key];
        if (!value.isNumeric()) {
            throw ConfigError("E_CONFIG_TYPE", "Configuration key 'health." + key + "' must be a number");
        }
        if (key == "error_rate_warn") {
            health.error_rate_warn = value.asDouble();
        } else if (key == "error_rate_fail") {
            health.error_rate_fail = value.asDouble();
        } else if (key == "error_rate_min_requests") {
            health.error_rate_min_requests = require_unsigned(value, "health." + key);
        } else if (key == "latency_warn_ms") {
            health.latency_warn_ms = value.asDouble();
        } else if (key == "latency_fail_ms") {
            health.latency_fail_ms = value.asDouble();
        } else if (key == "saturation_warn") {
            health.saturation_warn = value.asDouble();
        } else if (key == "memory_warn_mb") {
            health.memory_warn_mb = value.asDouble();
        } else if (key == "resource_age_warn") {
            health.resource_age_warn = std::chrono::seconds(require_unsigned(value, "health." + key));
        } else {
            throw ConfigError("E_CONFIG_UNKNOWN_KEY", "Unknown configuration key 'health." + key + "'");
        }
    }
}

}  // namespace

Config load_config_file(const std::filesystem::path& path, Config base) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Unable to open configuration file: " + path.string(),
                          "Check the --config path and file permissions");
    }
    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    Value document;
    try {
        document = protocol::parse_json(text);
    } catch (const protocol::JsonParseError& ex) {
        throw ConfigError("E_CONFIG_PARSE",
                          std::string(ex.what()) + " in " + path.string(),
                          "The configuration file must be a JSON object");
    }
    return apply_config_document(document, std::move(base));
}

Config apply_config_document(const Value& document, Config base) {
    if (!document.isObject()) {
        throw ConfigError("E_CONFIG_PARSE", "Configuration root must be a JSON object");
    }

    Config config = std::move(base);
    for (const auto& key : document.getMemberNames()) {
        const auto& value = document[key];
        if (key == "socket_path") {
            config.socket_path = require_string_value(value, key);
        } else if (key == "max_connections") {
            config.max_connections = require_unsigned(value, key);
        } else if (key == "max_request_bytes") {
            config.max_request_bytes = require_unsigned(value, key);
        } else if (key == "request_timeout") {
            config.request_timeout = std::chrono::seconds(require_unsigned(value, key));
        } else if (key == "execution_timeout") {
            config.execution_timeout = std::chrono::seconds(require_unsigned(value, key));
        } else if (key == "reaper_period") {
            config.reaper_period = std::chrono::seconds(require_unsigned(value, key));
        } else if (key == "idle_threshold") {
            config.idle_threshold = std::chrono::seconds(require_unsigned(value, key));
        } else if (key == "idle_thresholds") {
            require_object(value, key);
            for (const auto& kind_name : value.getMemberNames()) {
                const auto& seconds = value[kind_name];
                const auto kind = handle_kind_from_string(kind_name);
                if (!kind) {
                    throw ConfigError("E_CONFIG_UNKNOWN_KEY",
                                      "Unknown handle kind '" + kind_name + "' in idle_thresholds",
                                      "Valid kinds include database_connection, cipher_context, ftp_session");
                }
                config.idle_thresholds[*kind] = std::chrono::seconds(require_unsigned(seconds, "idle_thresholds." + kind_name));
            }
        } else if (key == "max_handles") {
            config.max_handles = require_unsigned(value, key);
        } else if (key == "metrics_window") {
            config.metrics_window = require_unsigned(value, key);
        } else if (key == "log_level") {
            config.log_level = require_string_value(value, key);
        } else if (key == "log_file") {
            config.log_file = require_string_value(value, key);
        } else if (key == "debug") {
            if (!value.isBool()) {
                throw ConfigError("E_CONFIG_TYPE", "Configuration key 'debug' must be a boolean");
            }
            config.debug = value.asBool();
        } else if (key == "limits") {
            apply_limits(value, config.limits);
        } else if (key == "health") {
            apply_health(value, config.health);
        } else if (key == "whitelist") {
            require_object(value, key);
            std::map<std::string, std::vector<std::string>> whitelist;
            for (const auto& module : value.getMemberNames()) {
                const auto& functions = value[module];
                if (!functions.isArray()) {
                    throw ConfigError("E_CONFIG_TYPE",
                                      "Configuration key 'whitelist." + module + "' must be an array of names");
                }
                auto& entries = whitelist[module];
                for (const auto& function : functions) {
                    entries.push_back(require_string_value(function, "whitelist." + module));
                }
            }
            config.whitelist = std::move(whitelist);
        } else {
            throw ConfigError("E_CONFIG_UNKNOWN_KEY",
                              "Unknown configuration key '" + key + "'",
                              "Remove the key or check its spelling");
        }
    }
    return config;
}

Config apply_environment(Config base, const EnvironmentLookup& lookup) {
    const EnvironmentLookup& get = lookup ? lookup : EnvironmentLookup(default_lookup);
    Config config = std::move(base);

    if (const auto value = get("CPAN_BRIDGE_SOCKET"); value && !value->empty()) {
        config.socket_path = *value;
    }
    if (const auto value = get("CPAN_BRIDGE_DEBUG"); value && !value->empty()) {
        config.debug = parse_env_unsigned("CPAN_BRIDGE_DEBUG", *value) > 0;
        if (config.debug) {
            config.log_level = "debug";
        }
    }
    if (const auto value = get("CPAN_BRIDGE_MAX_CONNECTIONS"); value && !value->empty()) {
        config.max_connections = parse_env_unsigned("CPAN_BRIDGE_MAX_CONNECTIONS", *value);
    }
    if (const auto value = get("CPAN_BRIDGE_MAX_REQUEST_SIZE"); value && !value->empty()) {
        config.max_request_bytes = parse_env_unsigned("CPAN_BRIDGE_MAX_REQUEST_SIZE", *value);
    }
    if (const auto value = get("CPAN_BRIDGE_TIMEOUT"); value && !value->empty()) {
        config.idle_threshold = std::chrono::seconds(parse_env_unsigned("CPAN_BRIDGE_TIMEOUT", *value));
    }
    if (const auto value = get("CPAN_BRIDGE_CLEANUP_INTERVAL"); value && !value->empty()) {
        config.reaper_period = std::chrono::seconds(parse_env_unsigned("CPAN_BRIDGE_CLEANUP_INTERVAL", *value));
    }
    return config;
}

void validate_config(const Config& config) {
    if (config.socket_path.empty()) {
        throw ConfigError("E_CONFIG_SOCKET", "Socket path must not be empty");
    }
    // sockaddr_un::sun_path holds 108 bytes including the terminator.
    if (config.socket_path.size() >= 108) {
        throw ConfigError("E_CONFIG_SOCKET",
                          "Socket path is too long: " + config.socket_path,
                          "Choose a path shorter than 108 bytes");
    }
    if (config.max_connections == 0) {
        throw ConfigError("E_CONFIG_RANGE", "max_connections must be at least 1");
    }
    if (config.max_request_bytes == 0) {
        throw ConfigError("E_CONFIG_RANGE", "max_request_bytes must be at least 1");
    }
    if (config.reaper_period.count() <= 0) {
        throw ConfigError("E_CONFIG_RANGE", "reaper_period must be at least 1 second");
    }
    if (config.idle_threshold.count() <= 0) {
        throw ConfigError("E_CONFIG_RANGE", "idle_threshold must be at least 1 second");
    }
    for (const auto& [kind, threshold] : config.idle_thresholds) {
        if (threshold.count() <= 0) {
            throw ConfigError("E_CONFIG_RANGE",
                              "idle threshold for " + std::string(handle_kind_to_string(kind)) + " must be at least 1 second");
        }
    }
    if (config.request_timeout.count() <= 0 || config.execution_timeout.count() <= 0) {
        throw ConfigError("E_CONFIG_RANGE", "Timeouts must be at least 1 second");
    }
    if (config.max_handles == 0 || config.metrics_window == 0) {
        throw ConfigError("E_CONFIG_RANGE", "max_handles and metrics_window must be positive");
    }
    const auto& level = config.log_level;
    if (level != "debug" && level != "info" && level != "warning" && level != "error") {
        throw ConfigError("E_CONFIG_LOG_LEVEL",
                          "Unknown log level '" + level + "'",
                          "Use one of debug, info, warning, error");
    }
    if (config.health.error_rate_warn > config.health.error_rate_fail) {
        throw ConfigError("E_CONFIG_RANGE", "health.error_rate_warn must not exceed health.error_rate_fail");
    }
}

Value describe_config(const Config& config) {
    Value root(Json::objectValue);
    root["socket_path"] = config.socket_path;
    root["max_connections"] = static_cast<Json::UInt64>(config.max_connections);
    root["max_request_bytes"] = static_cast<Json::UInt64>(config.max_request_bytes);
    root["request_timeout"] = static_cast<Json::Int64>(config.request_timeout.count());
    root["execution_timeout"] = static_cast<Json::Int64>(config.execution_timeout.count());
    root["reaper_period"] = static_cast<Json::Int64>(config.reaper_period.count());
    root["idle_threshold"] = static_cast<Json::Int64>(config.idle_threshold.count());
    Value thresholds(Json::objectValue);
    for (const auto& [kind, threshold] : config.idle_thresholds) {
        thresholds[std::string(handle_kind_to_string(kind))] = static_cast<Json::Int64>(threshold.count());
    }
    root["idle_thresholds"] = thresholds;
    root["max_handles"] = static_cast<Json::UInt64>(config.max_handles);
    root["metrics_window"] = static_cast<Json::UInt64>(config.metrics_window);
    root["log_level"] = config.log_level;
    root["debug"] = config.debug;
    auto& limits = root["limits"];
    limits["max_string_length"] = static_cast<Json::UInt64>(config.limits.max_string_length);
    limits["max_array_length"] = static_cast<Json::UInt64>(config.limits.max_array_length);
    limits["max_object_depth"] = static_cast<Json::UInt64>(config.limits.max_object_depth);
    limits["max_param_count"] = static_cast<Json::UInt64>(config.limits.max_param_count);
    return root;
}

}  // namespace cpanbridge
