#include "cpanbridge/Types.hpp"

namespace cpanbridge {

std::string_view handle_kind_to_string(HandleKind kind) noexcept {
    switch (kind) {
        case HandleKind::DatabaseConnection:
            return "database_connection";
        case HandleKind::PreparedStatement:
            return "prepared_statement";
        case HandleKind::CipherContext:
            return "cipher_context";
        case HandleKind::FtpSession:
            return "ftp_session";
        case HandleKind::DomParser:
            return "dom_parser";
        case HandleKind::DomDocument:
            return "dom_document";
        case HandleKind::DomNode:
            return "dom_node";
        case HandleKind::DomNodeList:
            return "dom_nodelist";
        case HandleKind::LockManager:
            return "lock_manager";
        case HandleKind::Lock:
            return "lock";
        case HandleKind::Logger:
            return "logger";
    }
    return "unknown";
}

std::optional<HandleKind> handle_kind_from_string(std::string_view text) {
    for (const auto kind : kAllHandleKinds) {
        if (handle_kind_to_string(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view handle_kind_prefix(HandleKind kind) noexcept {
    switch (kind) {
        case HandleKind::DatabaseConnection:
            return "conn";
        case HandleKind::PreparedStatement:
            return "stmt";
        case HandleKind::CipherContext:
            return "cipher";
        case HandleKind::FtpSession:
            return "ftp";
        case HandleKind::DomParser:
            return "parser";
        case HandleKind::DomDocument:
            return "doc";
        case HandleKind::DomNode:
            return "node";
        case HandleKind::DomNodeList:
            return "nodelist";
        case HandleKind::LockManager:
            return "lockmgr";
        case HandleKind::Lock:
            return "lock";
        case HandleKind::Logger:
            return "logger";
    }
    return "handle";
}

}  // namespace cpanbridge
