#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace cpanbridge {

// Failure categories reported to clients through the "error_type" field.
enum class ErrorKind {
    Transport,
    Authorization,
    Validation,
    Handle,
    Execution,
    Resource,
    Internal
};

std::string_view error_kind_to_string(ErrorKind kind) noexcept;

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

[[noreturn]] void throw_validation_error(std::string message);
[[noreturn]] void throw_execution_error(std::string message);
[[noreturn]] void throw_handle_not_found(std::string_view id);

}  // namespace cpanbridge
