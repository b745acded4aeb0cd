#include "deckwarden/core/SessionTracker.hpp"
#include <utility>

namespace deckwarden::core
{

SessionTracker::SessionTracker(deckwarden::gateway::IVaultGateway& gateway, ItemCache& cache) noexcept
    : m_gateway(&gateway), m_cache(&cache)
{
}

void SessionTracker::refreshStatus(RefreshCallback done)
{
    m_gateway->status(
        [this, done = std::move(done)](deckwarden::gateway::GatewayResult<deckwarden::gateway::StatusPayload> result)
        {
            SessionInfo next{};
            m_lastError.reset();
            if (auto* payload = std::get_if<deckwarden::gateway::StatusPayload>(&result))
            {
                next.status = parseSessionStatus(payload->status);
                if (next.status == SessionStatus::Unknown)
                {
                    m_lastError = "Status response did not contain a recognized status.";
                }
                else
                {
                    next.rawStatus = payload->status;
                    next.userEmail = std::move(payload->userEmail);
                }
            }
            else
            {
                m_lastError = std::get<deckwarden::gateway::GatewayError>(result).message;
            }

            apply(std::move(next));

            if (done)
            {
                done(m_info);
            }
        });
}

const SessionInfo& SessionTracker::info() const noexcept
{
    return m_info;
}

SessionStatus SessionTracker::status() const noexcept
{
    return m_info.status;
}

bool SessionTracker::isUnlocked() const noexcept
{
    return m_info.status == SessionStatus::Unlocked;
}

const std::optional<std::string>& SessionTracker::lastError() const noexcept
{
    return m_lastError;
}

void SessionTracker::apply(SessionInfo info)
{
    m_info = std::move(info);
    if (m_info.status != SessionStatus::Unlocked)
    {
        m_cache->clear();
    }
}

} // namespace deckwarden::core
