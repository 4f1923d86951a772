#include "cpanbridge/core/BridgeError.hpp"

namespace cpanbridge {

std::string_view error_kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Authorization:
            return "authorization";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Handle:
            return "handle";
        case ErrorKind::Execution:
            return "execution";
        case ErrorKind::Resource:
            return "resource";
        case ErrorKind::Internal:
            return "internal";
    }
    return "internal";
}

void throw_validation_error(std::string message) {
    throw BridgeError(ErrorKind::Validation, message);
}

void throw_execution_error(std::string message) {
    throw BridgeError(ErrorKind::Execution, message);
}

void throw_handle_not_found(std::string_view id) {
    throw BridgeError(ErrorKind::Handle, "Handle not found: " + std::string(id));
}

}  // namespace cpanbridge
