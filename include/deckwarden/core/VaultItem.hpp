#ifndef INCLUDE_DECKWARDEN_CORE_VAULTITEM_HPP
#define INCLUDE_DECKWARDEN_CORE_VAULTITEM_HPP

#include <optional>
#include <string>
#include <vector>

namespace deckwarden::core
{

struct VaultItemSummary final
{
    std::string id;
    std::string name;

    friend bool operator==(const VaultItemSummary&, const VaultItemSummary&) = default;
};

struct VaultItemDetail final
{
    std::string id;
    std::string name;
    std::optional<std::string> username{};
    std::optional<std::string> password{};
    std::optional<std::string> totp{};
    std::vector<std::string> uris{};
};

} // namespace deckwarden::core

#endif // INCLUDE_DECKWARDEN_CORE_VAULTITEM_HPP
