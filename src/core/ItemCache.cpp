#include "deckwarden/core/ItemCache.hpp"
#include "deckwarden/security/MemoryWiper.hpp"

namespace deckwarden::core
{

void ItemCache::replaceResults(std::vector<VaultItemSummary> items)
{
    m_selectedId.reset();
    wipeDetail();
    m_results = std::move(items);
}

void ItemCache::select(std::string id)
{
    wipeDetail();
    m_selectedId = std::move(id);
}

bool ItemCache::setDetail(VaultItemDetail detail)
{
    if (!m_selectedId || *m_selectedId != detail.id)
    {
        return false;
    }
    wipeDetail();
    m_detail = std::move(detail);
    return true;
}

void ItemCache::clearDetail() noexcept
{
    wipeDetail();
}

void ItemCache::clear() noexcept
{
    m_results.clear();
    m_selectedId.reset();
    wipeDetail();
}

bool ItemCache::empty() const noexcept
{
    return m_results.empty() && !m_selectedId.has_value() && !m_detail.has_value();
}

const std::vector<VaultItemSummary>& ItemCache::results() const noexcept
{
    return m_results;
}

const std::optional<std::string>& ItemCache::selectedId() const noexcept
{
    return m_selectedId;
}

const std::optional<VaultItemDetail>& ItemCache::detail() const noexcept
{
    return m_detail;
}

void ItemCache::wipeDetail() noexcept
{
    if (!m_detail)
    {
        return;
    }
    if (m_detail->password)
    {
        deckwarden::security::secureWipe(*m_detail->password);
    }
    if (m_detail->totp)
    {
        deckwarden::security::secureWipe(*m_detail->totp);
    }
    m_detail.reset();
}

} // namespace deckwarden::core
