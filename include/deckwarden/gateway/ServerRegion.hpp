#ifndef INCLUDE_DECKWARDEN_GATEWAY_SERVERREGION_HPP
#define INCLUDE_DECKWARDEN_GATEWAY_SERVERREGION_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace deckwarden::gateway
{

// The two fixed hosting regions offered by the login toggle. Never free text.
enum class ServerRegion : std::uint8_t
{
    Us,
    Eu,
};

[[nodiscard]] constexpr std::string_view regionTag(ServerRegion region) noexcept
{
    return region == ServerRegion::Eu ? std::string_view{ "eu" } : std::string_view{ "us" };
}

[[nodiscard]] constexpr std::string_view regionServerUrl(ServerRegion region) noexcept
{
    return region == ServerRegion::Eu ? std::string_view{ "https://vault.bitwarden.eu" }
                                      : std::string_view{ "https://vault.bitwarden.com" };
}

[[nodiscard]] constexpr std::optional<ServerRegion> regionFromTag(std::string_view tag) noexcept
{
    if (tag == "us")
    {
        return ServerRegion::Us;
    }
    if (tag == "eu")
    {
        return ServerRegion::Eu;
    }
    return std::nullopt;
}

} // namespace deckwarden::gateway

#endif // INCLUDE_DECKWARDEN_GATEWAY_SERVERREGION_HPP
