#ifndef INCLUDE_DECKWARDEN_CORE_SESSIONTRACKER_HPP
#define INCLUDE_DECKWARDEN_CORE_SESSIONTRACKER_HPP

#include "deckwarden/core/ItemCache.hpp"
#include "deckwarden/core/SessionStatus.hpp"
#include "deckwarden/gateway/IVaultGateway.hpp"
#include <functional>
#include <optional>
#include <string>

namespace deckwarden::core
{

// Single source of truth for the vault status. Every status change that leaves Unlocked clears
// the item cache in the same step.
class SessionTracker final
{
public:
    using RefreshCallback = std::function<void(const SessionInfo&)>;

    SessionTracker(deckwarden::gateway::IVaultGateway& gateway, ItemCache& cache) noexcept;

    SessionTracker(const SessionTracker&) = delete;
    SessionTracker& operator=(const SessionTracker&) = delete;
    SessionTracker(SessionTracker&&) = delete;
    SessionTracker& operator=(SessionTracker&&) = delete;
    ~SessionTracker() = default;

    // Queries the gateway and applies the answer. Transport failures and missing status fields
    // yield Unknown, never Error.
    void refreshStatus(RefreshCallback done);

    [[nodiscard]] const SessionInfo& info() const noexcept;
    [[nodiscard]] SessionStatus status() const noexcept;
    [[nodiscard]] bool isUnlocked() const noexcept;

    // Why the last status query produced Unknown; empty after a recognized answer.
    [[nodiscard]] const std::optional<std::string>& lastError() const noexcept;

private:
    void apply(SessionInfo info);

    deckwarden::gateway::IVaultGateway* m_gateway{ nullptr };
    ItemCache* m_cache{ nullptr };
    SessionInfo m_info{};
    std::optional<std::string> m_lastError{};
};

} // namespace deckwarden::core

#endif // INCLUDE_DECKWARDEN_CORE_SESSIONTRACKER_HPP
