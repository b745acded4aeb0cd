#ifndef INCLUDE_DECKWARDEN_CORE_SESSIONSTATUS_HPP
#define INCLUDE_DECKWARDEN_CORE_SESSIONSTATUS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deckwarden::core
{

enum class SessionStatus : std::uint8_t
{
    Unknown,
    Locked,
    Unlocked,
    Error,
};

struct SessionInfo final
{
    SessionStatus status{ SessionStatus::Unknown };
    std::optional<std::string> userEmail{};
    // Status string exactly as the CLI reported it; empty when no status was recognized.
    std::string rawStatus{};
};

// Case-insensitive. "unlocked"/"locked" map to their members, any other non-blank value maps to Error
// (a definite, non-unlocked state such as "unauthenticated"), blank maps to Unknown.
[[nodiscard]] SessionStatus parseSessionStatus(std::string_view raw) noexcept;

[[nodiscard]] std::string_view toString(SessionStatus status) noexcept;

// Text for the status line: the raw CLI value when present, otherwise the enum name.
[[nodiscard]] std::string describe(const SessionInfo& info);

} // namespace deckwarden::core

#endif // INCLUDE_DECKWARDEN_CORE_SESSIONSTATUS_HPP
