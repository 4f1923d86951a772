#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cpanbridge {

enum class HandleKind : std::uint8_t {
    DatabaseConnection,
    PreparedStatement,
    CipherContext,
    FtpSession,
    DomParser,
    DomDocument,
    DomNode,
    DomNodeList,
    LockManager,
    Lock,
    Logger
};

inline constexpr HandleKind kAllHandleKinds[] = {
    HandleKind::DatabaseConnection,
    HandleKind::PreparedStatement,
    HandleKind::CipherContext,
    HandleKind::FtpSession,
    HandleKind::DomParser,
    HandleKind::DomDocument,
    HandleKind::DomNode,
    HandleKind::DomNodeList,
    HandleKind::LockManager,
    HandleKind::Lock,
    HandleKind::Logger,
};

std::string_view handle_kind_to_string(HandleKind kind) noexcept;
std::optional<HandleKind> handle_kind_from_string(std::string_view text);

// Short prefix used when minting handle ids ("conn", "stmt", ...).
std::string_view handle_kind_prefix(HandleKind kind) noexcept;

}  // namespace cpanbridge
