#ifndef INCLUDE_DECKWARDEN_CORE_ITEMCACHE_HPP
#define INCLUDE_DECKWARDEN_CORE_ITEMCACHE_HPP

#include "deckwarden/core/VaultItem.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deckwarden::core
{

// Last search results plus at most one selected item and its detail.
// Only the orchestrator writes to it; views read through the const accessors.
class ItemCache final
{
public:
    // Replaces the result set wholesale and drops any selection, listed or not.
    void replaceResults(std::vector<VaultItemSummary> items);

    // Marks `id` as selected and discards the previous detail immediately.
    void select(std::string id);

    // Stores `detail` if it belongs to the current selection. Returns false (and stores nothing) otherwise.
    [[nodiscard]] bool setDetail(VaultItemDetail detail);

    void clearDetail() noexcept;
    void clear() noexcept;

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const std::vector<VaultItemSummary>& results() const noexcept;
    [[nodiscard]] const std::optional<std::string>& selectedId() const noexcept;
    [[nodiscard]] const std::optional<VaultItemDetail>& detail() const noexcept;

private:
    void wipeDetail() noexcept;

    std::vector<VaultItemSummary> m_results;
    std::optional<std::string> m_selectedId;
    std::optional<VaultItemDetail> m_detail;
};

} // namespace deckwarden::core

#endif // INCLUDE_DECKWARDEN_CORE_ITEMCACHE_HPP
