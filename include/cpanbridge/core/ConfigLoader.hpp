#pragma once

#include "cpanbridge/Config.hpp"
#include "cpanbridge/core/Value.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace cpanbridge {

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads a JSON configuration file and overlays it on |base|.
Config load_config_file(const std::filesystem::path& path, Config base);

// Overlays an already-parsed configuration document.
Config apply_config_document(const Value& document, Config base);

// Overlays CPAN_BRIDGE_* variables. |lookup| defaults to std::getenv.
Config apply_environment(Config base, const EnvironmentLookup& lookup = {});

// Throws ConfigError when a value is out of range.
void validate_config(const Config& config);

Value describe_config(const Config& config);

}  // namespace cpanbridge
